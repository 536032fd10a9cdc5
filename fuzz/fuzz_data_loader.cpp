/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV DataLoader and the downstream pipeline.
 *
 * Build:
 *   cmake -DTAFEAT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB for any byte sequence.
 *   2. Every parsed bar passes validate_bar.
 *   3. If the bars form a valid series, the default pipeline runs and every
 *      defined feature value is finite.
 *   4. The only exception that may escape series construction is
 *      StructuralError (unordered or duplicate dates).
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

#include "tafeat/data_loader.hpp"
#include "tafeat/errors.hpp"
#include "tafeat/pipeline.hpp"

using namespace tafeat;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    auto parsed = core::DataLoader::parse_csv_string(input);
    for (const Bar& bar : parsed.bars) {
        if (!core::DataLoader::validate_bar(bar)) std::abort();
    }
    if (parsed.bars.empty()) {
        return 0;
    }

    try {
        const PriceSeries series(std::move(parsed.bars));
        static const pipeline::FeaturePipeline features(config::default_pipeline_config());
        const auto table = features.run(series);
        for (const auto& name : table.feature_names()) {
            for (const Cell& c : table.column(name)) {
                if (c && !std::isfinite(*c)) std::abort();
            }
        }
    } catch (const StructuralError&) {
        // Out-of-order dates are a legitimate rejection.
    }
    return 0;
}
