/**
 * @file  fuzz_spec_parser.cpp
 * @brief libFuzzer target for spec strings and config-file text.
 *
 * Build:
 *   cmake -DTAFEAT_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_spec_parser
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB for any byte sequence.
 *   2. Malformed input is reported only as ParameterError; no other
 *      exception type escapes make_transform, make_labeler or parse_config.
 *   3. A config that parses yields a pipeline that either validates or
 *      throws ParameterError.
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "tafeat/config.hpp"
#include "tafeat/errors.hpp"
#include "tafeat/labels.hpp"
#include "tafeat/pipeline.hpp"

using namespace tafeat;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    try {
        (void)pipeline::make_transform(input);
    } catch (const ParameterError&) {
    }

    try {
        (void)labels::make_labeler(input);
    } catch (const ParameterError&) {
    }

    try {
        const auto cfg = config::parse_config(input);
        const pipeline::FeaturePipeline p(cfg);
        (void)p.output_names();
    } catch (const ParameterError&) {
    }
    return 0;
}
