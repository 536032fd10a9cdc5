/// @file src/config/pipeline_config.cpp
/// @brief Default pipeline configuration and the key=value config file.

#include "tafeat/config.hpp"
#include "tafeat/constants.hpp"
#include "tafeat/errors.hpp"

#include <fmt/format.h>

#include <fstream>
#include <sstream>

namespace tafeat::config {

namespace {

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

// ─── default_pipeline_config ──────────────────────────────────────────────────

PipelineConfig default_pipeline_config() {
    using namespace constants;
    PipelineConfig cfg;
    cfg.transforms = {
        fmt::format("sma window={}", SHORT_MA_WINDOW),
        fmt::format("sma window={}", LONG_MA_WINDOW),
        fmt::format("ema span={}", EMA_SPAN),
        "returns",
        fmt::format("volatility window={}", VOLATILITY_WINDOW),
        fmt::format("distance average=MA{}", DISTANCE_MA_WINDOW),
        fmt::format("distance average=EMA{}", DISTANCE_EMA_SPAN),
        fmt::format("cumulated_return period={}", CUMULATED_RETURN_PERIOD),
        fmt::format("rsi period={}", RSI_PERIOD),
    };
    return cfg;
}

// ─── parse_config ─────────────────────────────────────────────────────────────

PipelineConfig parse_config(std::string_view text) {
    PipelineConfig cfg;

    std::istringstream stream{std::string(text)};
    std::string raw;
    std::size_t line_no = 0;

    while (std::getline(stream, raw)) {
        ++line_no;
        const std::string_view line = trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            throw ParameterError("line", fmt::format(
                "config line {}: expected 'key = value', got '{}'", line_no, line));
        }
        const std::string_view key   = trim(line.substr(0, eq));
        const std::string_view value = trim(line.substr(eq + 1));
        if (value.empty()) {
            throw ParameterError(std::string(key), fmt::format(
                "config line {}: '{}' has no value", line_no, key));
        }

        if (key == "transform") {
            cfg.transforms.emplace_back(value);
        } else if (key == "label") {
            if (cfg.label) {
                throw ParameterError("label", fmt::format(
                    "config line {}: only one label constructor may be configured", line_no));
            }
            cfg.label = std::string(value);
        } else if (key == "verbose") {
            cfg.verbose = (value == "true" || value == "1" || value == "yes");
            if (!cfg.verbose && value != "false" && value != "0" && value != "no") {
                throw ParameterError("verbose", fmt::format(
                    "config line {}: verbose must be true or false (got '{}')", line_no, value));
            }
        } else {
            throw ParameterError(std::string(key), fmt::format(
                "config line {}: unknown key '{}'", line_no, key));
        }
    }
    return cfg;
}

// ─── load_config ──────────────────────────────────────────────────────────────

PipelineConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ParameterError("config", fmt::format("cannot open config file '{}'", path));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_config(contents.str());
}

}  // namespace tafeat::config
