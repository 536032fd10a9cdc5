/// @file src/labels/labeler_factory.cpp
/// @brief Spec-string construction of label constructors.

#include "tafeat/labels.hpp"
#include "tafeat/config.hpp"
#include "tafeat/errors.hpp"

#include <fmt/format.h>

namespace tafeat::labels {

namespace {

RegimePolicy parse_policy(const std::string& value) {
    if (value == "binary")  return RegimePolicy::Binary;
    if (value == "ternary") return RegimePolicy::Ternary;
    throw ParameterError("policy", fmt::format(
        "threshold: policy must be 'binary' or 'ternary' (got '{}')", value));
}

}  // namespace

std::unique_ptr<Labeler> make_labeler(std::string_view text) {
    const config::Spec spec = config::parse_spec(text);
    config::OptionReader opts(spec);

    if (spec.kind == "threshold") {
        ThresholdHorizonParams p;
        p.horizon   = opts.get_size("horizon", constants::LABEL_HORIZON);
        p.threshold = opts.get_double("threshold", constants::LABEL_THRESHOLD);
        p.use_log   = opts.get_bool("log", false);
        p.policy    = parse_policy(opts.get_string("policy", "binary"));
        opts.finish();
        return std::make_unique<ThresholdHorizonLabeler>(p);
    }

    if (spec.kind == "crossover") {
        const std::size_t fast = opts.get_size("short", constants::SHORT_MA_WINDOW);
        const std::size_t slow = opts.get_size("long", constants::LONG_MA_WINDOW);
        opts.finish();
        return std::make_unique<CrossoverLabeler>(fast, slow);
    }

    throw ParameterError("kind", fmt::format(
        "unknown label constructor '{}' (expected 'threshold' or 'crossover')", spec.kind));
}

}  // namespace tafeat::labels
