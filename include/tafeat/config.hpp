#pragma once

/// @file include/tafeat/config.hpp
/// @brief Transform/label spec strings and the pipeline config file.
///
/// # Spec strings
/// A transform or labeler is configured by a kind followed by `key=value`
/// options, separated by whitespace:
/// ```
/// sma window=10
/// ema span=20 source=close
/// distance average=MA50
/// threshold horizon=10 threshold=0.05 policy=ternary
/// ```
/// Each kind recognizes a fixed option set; anything else is rejected with a
/// `ParameterError` naming the option.
///
/// # Config file
/// ```
/// # comment
/// transform = sma window=10
/// transform = rsi period=14
/// label     = crossover short=10 long=50
/// verbose   = true
/// ```
/// `transform` lines are applied in file order. Blank lines and `#` comments
/// are ignored.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tafeat::config {

// ─── Spec ─────────────────────────────────────────────────────────────────────

/// A parsed spec string: kind plus ordered key/value options.
struct Spec {
    std::string                                      kind;
    std::vector<std::pair<std::string, std::string>> options;
};

/// Parse `"kind key=value ..."`.
///
/// # Throws
/// `ParameterError` if the text is blank, a token lacks `=`, a key or value
/// is empty, or a key is repeated.
[[nodiscard]] Spec parse_spec(std::string_view text);

// ─── OptionReader ─────────────────────────────────────────────────────────────

/// Typed, consuming access to a spec's options.
///
/// Every `get_*` marks its key as recognized; `finish()` then rejects any
/// option the consumer did not ask for.
class OptionReader {
public:
    explicit OptionReader(const Spec& spec);

    /// Non-negative integer option, or `fallback` when absent.
    [[nodiscard]] std::size_t get_size(std::string_view key, std::size_t fallback);

    /// Floating-point option, or `fallback` when absent.
    [[nodiscard]] double get_double(std::string_view key, double fallback);

    /// Boolean option (true/false/1/0/yes/no), or `fallback` when absent.
    [[nodiscard]] bool get_bool(std::string_view key, bool fallback);

    /// Raw string option, or `fallback` when absent.
    [[nodiscard]] std::string get_string(std::string_view key, std::string fallback);

    /// # Throws
    /// `ParameterError` naming the first option no getter consumed.
    void finish() const;

private:
    [[nodiscard]] const std::string* find(std::string_view key);

    const Spec&       spec_;
    std::vector<bool> used_;
};

// ─── PipelineConfig ───────────────────────────────────────────────────────────

/// Runtime configuration of a feature pipeline run.
struct PipelineConfig {
    /// Transform spec strings, applied in order.
    std::vector<std::string> transforms;

    /// Optional labeler spec string.
    std::optional<std::string> label;

    /// If true, print one diagnostic line per applied transform to stderr.
    bool verbose = false;
};

/// The reference feature set: MA10, MA50, EMA20, Return, Log Return,
/// Volatility20, Distance_MA50, Distance_EMA20, Cumulated_Return_5d, RSI14.
[[nodiscard]] PipelineConfig default_pipeline_config();

/// Parse config-file text.
///
/// # Throws
/// `ParameterError` for an unknown key, a line without `=`, or a second
/// `label` line.
[[nodiscard]] PipelineConfig parse_config(std::string_view text);

/// Read and parse a config file.
///
/// # Throws
/// `ParameterError` as `parse_config`, or if the file cannot be opened.
[[nodiscard]] PipelineConfig load_config(const std::string& path);

}  // namespace tafeat::config
