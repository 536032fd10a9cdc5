/// @file src/labels/threshold_labeler.cpp
/// @brief Forward return and the threshold-horizon regime labeler.

#include "tafeat/labels.hpp"
#include "tafeat/cell_ops.hpp"

#include "detail/validation.hpp"

#include <fmt/format.h>

namespace tafeat::labels {

// ─── forward_return ───────────────────────────────────────────────────────────

Column forward_return(const PriceSeries& series, std::size_t horizon, bool use_log) {
    detail::require_at_least("forward_return", "horizon", horizon, 1);

    const auto closes = series.closes();
    Column out(closes.size());
    if (closes.size() <= horizon) {
        return out;
    }

    // Rows i > n-1-horizon have no bar at i+horizon and stay missing.
    for (std::size_t i = 0; i + horizon < closes.size(); ++i) {
        const Cell ratio = cells::div(closes[i + horizon], closes[i]);
        out[i] = use_log ? cells::log(ratio)
                         : cells::lift1(ratio, [](double r) { return r - 1.0; });
    }
    return out;
}

// ─── ThresholdHorizonLabeler ──────────────────────────────────────────────────

ThresholdHorizonLabeler::ThresholdHorizonLabeler(ThresholdHorizonParams params)
    : params_(params)
{
    detail::require_at_least("ThresholdHorizonLabeler", "horizon", params_.horizon, 1);
    detail::require_positive("ThresholdHorizonLabeler", "threshold", params_.threshold);
}

std::string ThresholdHorizonLabeler::name() const {
    return fmt::format("{}_{}d",
                       params_.policy == RegimePolicy::Binary ? "Label" : "Regime",
                       params_.horizon);
}

LabelColumn ThresholdHorizonLabeler::label(const PriceSeries& series) const {
    const Column fwd = forward_return(series, params_.horizon, params_.use_log);
    const double t = params_.threshold;

    LabelColumn out{.name = name(), .values = std::vector<LabelCell>(fwd.size())};
    for (std::size_t i = 0; i < fwd.size(); ++i) {
        if (!fwd[i]) {
            continue;
        }
        const double r = *fwd[i];
        if (params_.policy == RegimePolicy::Binary) {
            out.values[i] = (r > t) ? Regime::Bullish : Regime::NonBullish;
        } else if (r > t) {
            out.values[i] = Regime::Bull;
        } else if (r < -t) {
            out.values[i] = Regime::Bear;
        } else {
            out.values[i] = Regime::Range;
        }
    }
    return out;
}

}  // namespace tafeat::labels
