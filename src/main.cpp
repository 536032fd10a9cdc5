/// @file src/main.cpp
/// @brief tafeat CLI entry point.
///
/// Usage:
///   tafeat --features <csv> [--config <file>] [--label <spec>] [--verbose]
///   tafeat --list                  Print the default transform specs
///   tafeat --help                  Print usage

#include "tafeat/config.hpp"
#include "tafeat/data_loader.hpp"
#include "tafeat/errors.hpp"
#include "tafeat/labels.hpp"
#include "tafeat/pipeline.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  tafeat --features <csv> [options]   Compute features (CSV to stdout)\n"
        "  tafeat --list                       Show the default transforms\n"
        "  tafeat --help                       Show this help\n"
        "\n"
        "Options:\n"
        "  --config <file>   Pipeline config (transform/label/verbose lines)\n"
        "  --label <spec>    Label constructor, e.g.\n"
        "                      \"threshold horizon=10 threshold=0.05 policy=ternary\"\n"
        "                      \"crossover short=10 long=50\"\n"
        "  --verbose         Print one line per transform to stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  Date,Open,High,Low,Close,Volume\n"
    );
}

struct Options {
    std::string                input;
    std::optional<std::string> config_path;
    std::optional<std::string> label;
    bool                       verbose = false;
};

/// Render one cell; missing cells are empty fields.
std::string render(const tafeat::Cell& cell) {
    return cell ? fmt::format("{:.10g}", *cell) : std::string{};
}

/// Write date, every table column and the optional label as CSV.
void write_csv(const tafeat::pipeline::FeatureTable& table,
               const tafeat::LabelColumn* labels) {
    std::string header = "date";
    for (const std::string& name : table.names()) {
        header += ',';
        header += name;
    }
    if (labels) {
        header += ',';
        header += labels->name;
    }
    fmt::print("{}\n", header);

    std::vector<const tafeat::Column*> cols;
    for (const std::string& name : table.names()) {
        cols.push_back(&table.column(name));
    }

    for (std::size_t i = 0; i < table.rows(); ++i) {
        std::string row = tafeat::format_date(table.timestamps()[i]);
        for (const tafeat::Column* c : cols) {
            row += ',';
            row += render((*c)[i]);
        }
        if (labels) {
            row += ',';
            if (labels->values[i]) {
                row += tafeat::to_string(*labels->values[i]);
            }
        }
        fmt::print("{}\n", row);
    }
}

/// Load, compute and print. Returns 0 on success, 1 on configuration or
/// input errors, 2 when no data is available.
int run_features(const Options& opts) {
    try {
        auto cfg = opts.config_path ? tafeat::config::load_config(*opts.config_path)
                                    : tafeat::config::default_pipeline_config();
        if (cfg.transforms.empty()) {
            cfg.transforms = tafeat::config::default_pipeline_config().transforms;
        }
        if (opts.label) {
            cfg.label = opts.label;
        }
        cfg.verbose = cfg.verbose || opts.verbose;

        // Construct everything before touching the data so configuration
        // errors surface first.
        const tafeat::pipeline::FeaturePipeline pipeline(cfg);
        std::unique_ptr<tafeat::labels::Labeler> labeler;
        if (cfg.label) {
            labeler = tafeat::labels::make_labeler(*cfg.label);
        }

        const auto series = tafeat::core::DataLoader::load_series(opts.input);
        if (cfg.verbose) {
            fmt::print(stderr, "[tafeat] loaded {} bars from '{}' ({} .. {})\n",
                       series.size(), opts.input,
                       tafeat::format_date(series.timestamps().front()),
                       tafeat::format_date(series.timestamps().back()));
        }

        const auto table = pipeline.run(series);

        std::optional<tafeat::LabelColumn> labels;
        if (labeler) {
            labels = labeler->label(series);
            if (cfg.verbose) {
                fmt::print(stderr, "[tafeat] label {} -> {}/{} rows labeled\n",
                           labels->name, labels->valid_count(), labels->values.size());
            }
        }

        write_csv(table, labels ? &*labels : nullptr);
        return 0;

    } catch (const tafeat::ParameterError& e) {
        fmt::print(stderr, "Configuration error ({}): {}\n", e.parameter(), e.what());
        return 1;
    } catch (const tafeat::DataUnavailableError& e) {
        fmt::print(stderr, "No data: {}\n", e.what());
        return 2;
    } catch (const tafeat::StructuralError& e) {
        fmt::print(stderr, "Malformed series: {}\n", e.what());
        return 1;
    }
}

void print_defaults() {
    for (const std::string& spec : tafeat::config::default_pipeline_config().transforms) {
        fmt::print("transform = {}\n", spec);
    }
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--list") {
        print_defaults();
        return 0;
    }

    if (mode != "--features") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    if (argc < 3) {
        fmt::print(stderr, "Error: --features requires a CSV file path\n");
        print_usage();
        return 1;
    }

    Options opts;
    opts.input = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--verbose") {
            opts.verbose = true;
        } else if ((arg == "--config" || arg == "--label") && i + 1 < argc) {
            (arg == "--config" ? opts.config_path : opts.label) = std::string(argv[++i]);
        } else {
            fmt::print(stderr, "Unknown or incomplete option: {}\n", arg);
            print_usage();
            return 1;
        }
    }

    return run_features(opts);
}
