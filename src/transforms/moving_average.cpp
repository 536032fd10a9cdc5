/// @file src/transforms/moving_average.cpp
/// @brief Simple and exponential moving averages over feature columns.

#include "tafeat/transforms.hpp"
#include "tafeat/cell_ops.hpp"

#include "detail/validation.hpp"

namespace tafeat::transforms {

// ─── simple_moving_average ────────────────────────────────────────────────────

Column simple_moving_average(std::span<const Cell> x, std::size_t window) {
    detail::require_at_least("simple_moving_average", "window", window, 1);

    Column out(x.size());
    if (x.size() < window) {
        return out;
    }

    for (std::size_t i = window - 1; i < x.size(); ++i) {
        const auto win = x.subspan(i + 1 - window, window);
        if (!cells::all_present(win)) {
            continue;
        }
        // Summed per window rather than as a running total so long series
        // do not accumulate add/subtract drift.
        double sum = 0.0;
        for (const Cell& c : win) {
            sum += *c;
        }
        out[i] = cells::finite(sum / static_cast<double>(window));
    }
    return out;
}

Column simple_moving_average(const PriceSeries& series, std::size_t window) {
    return simple_moving_average(cells::from_values(series.closes()), window);
}

// ─── exponential_moving_average ───────────────────────────────────────────────

Column exponential_moving_average(std::span<const Cell> x, std::size_t span) {
    detail::require_at_least("exponential_moving_average", "span", span, 1);

    const double alpha = 2.0 / (static_cast<double>(span) + 1.0);
    const double decay = 1.0 - alpha;

    Column out(x.size());

    // Weighted numerator Σ (1-α)^k x[i-k] and normaliser Σ (1-α)^k.
    // Both stay zero until the first present observation.
    double num = 0.0;
    double den = 0.0;

    for (std::size_t i = 0; i < x.size(); ++i) {
        num *= decay;
        den *= decay;
        if (!x[i]) {
            continue;
        }
        num += *x[i];
        den += 1.0;
        out[i] = cells::finite(num / den);
    }
    return out;
}

Column exponential_moving_average(const PriceSeries& series, std::size_t span) {
    return exponential_moving_average(cells::from_values(series.closes()), span);
}

}  // namespace tafeat::transforms
