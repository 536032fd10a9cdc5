/// @file src/pipeline/feature_transforms.cpp
/// @brief Named pipeline steps wrapping the column transforms, and the
///        spec-string factory.

#include "tafeat/pipeline.hpp"
#include "tafeat/config.hpp"
#include "tafeat/errors.hpp"
#include "tafeat/transforms.hpp"

#include "detail/validation.hpp"

#include <fmt/format.h>

namespace tafeat::pipeline {

namespace {

/// "MA10" for the close column, "volume_MA10" for any other source.
std::string default_name(const std::string& source, std::string_view stem) {
    if (source == "close") {
        return std::string(stem);
    }
    return fmt::format("{}_{}", source, stem);
}

std::string pick_name(std::string name, const std::string& source, std::string_view stem) {
    return name.empty() ? default_name(source, stem) : std::move(name);
}

}  // namespace

// ─── SmaTransform ─────────────────────────────────────────────────────────────

SmaTransform::SmaTransform(std::size_t window, std::string source, std::string name)
    : window_(window), source_(std::move(source))
{
    detail::require_at_least("sma", "window", window_, 1);
    name_ = pick_name(std::move(name), source_, fmt::format("MA{}", window_));
}

std::vector<NamedColumn> SmaTransform::apply(const FeatureTable& table) const {
    return {{name_, transforms::simple_moving_average(table.column(source_), window_)}};
}

// ─── EmaTransform ─────────────────────────────────────────────────────────────

EmaTransform::EmaTransform(std::size_t span, std::string source, std::string name)
    : span_(span), source_(std::move(source))
{
    detail::require_at_least("ema", "span", span_, 1);
    name_ = pick_name(std::move(name), source_, fmt::format("EMA{}", span_));
}

std::vector<NamedColumn> EmaTransform::apply(const FeatureTable& table) const {
    return {{name_, transforms::exponential_moving_average(table.column(source_), span_)}};
}

// ─── ReturnsTransform ─────────────────────────────────────────────────────────

ReturnsTransform::ReturnsTransform(std::string source)
    : source_(std::move(source))
{}

std::vector<std::string> ReturnsTransform::outputs() const {
    return {default_name(source_, "Return"), default_name(source_, "Log Return")};
}

std::vector<NamedColumn> ReturnsTransform::apply(const FeatureTable& table) const {
    const auto names = outputs();
    Column simple = transforms::simple_return(table.column(source_));
    Column logged = transforms::log_return(simple);
    return {{names[0], std::move(simple)}, {names[1], std::move(logged)}};
}

// ─── VolatilityTransform ──────────────────────────────────────────────────────

VolatilityTransform::VolatilityTransform(std::size_t window, std::string source, std::string name)
    : window_(window), source_(std::move(source))
{
    detail::require_at_least("volatility", "window", window_,
                             constants::MIN_VOLATILITY_WINDOW);
    name_ = pick_name(std::move(name), source_, fmt::format("Volatility{}", window_));
}

std::vector<NamedColumn> VolatilityTransform::apply(const FeatureTable& table) const {
    // Returns are computed locally so the step does not depend on a
    // "Return" column being present.
    const Column returns = transforms::simple_return(table.column(source_));
    return {{name_, transforms::volatility(returns, window_)}};
}

// ─── CumulatedReturnTransform ─────────────────────────────────────────────────

CumulatedReturnTransform::CumulatedReturnTransform(std::size_t period,
                                                   std::string source,
                                                   std::string name)
    : period_(period), source_(std::move(source))
{
    detail::require_at_least("cumulated_return", "period", period_, 1);
    name_ = pick_name(std::move(name), source_, fmt::format("Cumulated_Return_{}d", period_));
}

std::vector<NamedColumn> CumulatedReturnTransform::apply(const FeatureTable& table) const {
    const Column returns = transforms::simple_return(table.column(source_));
    return {{name_, transforms::cumulated_return(returns, period_)}};
}

// ─── DistanceTransform ────────────────────────────────────────────────────────

DistanceTransform::DistanceTransform(std::string average, std::string source, std::string name)
    : average_(std::move(average)), source_(std::move(source))
{
    if (average_.empty()) {
        throw ParameterError("average", "distance: average column name is required");
    }
    name_ = name.empty() ? fmt::format("Distance_{}", average_) : std::move(name);
}

std::vector<NamedColumn> DistanceTransform::apply(const FeatureTable& table) const {
    return {{name_, transforms::distance(table.column(source_), table.column(average_))}};
}

// ─── RsiTransform ─────────────────────────────────────────────────────────────

RsiTransform::RsiTransform(std::size_t period, std::string source, std::string name)
    : period_(period), source_(std::move(source))
{
    detail::require_at_least("rsi", "period", period_, 1);
    name_ = pick_name(std::move(name), source_, fmt::format("RSI{}", period_));
}

std::vector<NamedColumn> RsiTransform::apply(const FeatureTable& table) const {
    return {{name_, transforms::rsi(table.column(source_), period_)}};
}

// ─── make_transform ───────────────────────────────────────────────────────────

TransformPtr make_transform(std::string_view text) {
    using namespace constants;

    const config::Spec spec = config::parse_spec(text);
    config::OptionReader opts(spec);
    TransformPtr step;

    if (spec.kind == "sma") {
        const auto window = opts.get_size("window", SHORT_MA_WINDOW);
        auto source = opts.get_string("source", "close");
        auto name   = opts.get_string("name", {});
        opts.finish();
        step = std::make_unique<SmaTransform>(window, std::move(source), std::move(name));
    } else if (spec.kind == "ema") {
        const auto span = opts.get_size("span", EMA_SPAN);
        auto source = opts.get_string("source", "close");
        auto name   = opts.get_string("name", {});
        opts.finish();
        step = std::make_unique<EmaTransform>(span, std::move(source), std::move(name));
    } else if (spec.kind == "returns") {
        auto source = opts.get_string("source", "close");
        opts.finish();
        step = std::make_unique<ReturnsTransform>(std::move(source));
    } else if (spec.kind == "volatility") {
        const auto window = opts.get_size("window", VOLATILITY_WINDOW);
        auto source = opts.get_string("source", "close");
        auto name   = opts.get_string("name", {});
        opts.finish();
        step = std::make_unique<VolatilityTransform>(window, std::move(source), std::move(name));
    } else if (spec.kind == "cumulated_return") {
        const auto period = opts.get_size("period", CUMULATED_RETURN_PERIOD);
        auto source = opts.get_string("source", "close");
        auto name   = opts.get_string("name", {});
        opts.finish();
        step = std::make_unique<CumulatedReturnTransform>(period, std::move(source), std::move(name));
    } else if (spec.kind == "distance") {
        auto average = opts.get_string("average", {});
        auto source  = opts.get_string("source", "close");
        auto name    = opts.get_string("name", {});
        opts.finish();
        step = std::make_unique<DistanceTransform>(std::move(average), std::move(source), std::move(name));
    } else if (spec.kind == "rsi") {
        const auto period = opts.get_size("period", RSI_PERIOD);
        auto source = opts.get_string("source", "close");
        auto name   = opts.get_string("name", {});
        opts.finish();
        step = std::make_unique<RsiTransform>(period, std::move(source), std::move(name));
    } else {
        throw ParameterError("kind", fmt::format("unknown transform '{}'", spec.kind));
    }
    return step;
}

}  // namespace tafeat::pipeline
