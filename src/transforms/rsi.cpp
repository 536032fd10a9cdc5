/// @file src/transforms/rsi.cpp
/// @brief Relative Strength Index with an explicit zero-loss policy.

#include "tafeat/transforms.hpp"
#include "tafeat/cell_ops.hpp"
#include "tafeat/constants.hpp"

#include "detail/validation.hpp"

#include <algorithm>

namespace tafeat::transforms {

Column rsi(std::span<const Cell> prices, std::size_t period) {
    detail::require_at_least("rsi", "period", period, 1);

    // Split each price change into a gain and a non-negative loss magnitude.
    // Row 0 has no change and stays missing in both.
    Column gains(prices.size());
    Column losses(prices.size());
    for (std::size_t i = 1; i < prices.size(); ++i) {
        const Cell delta = cells::sub(prices[i], prices[i - 1]);
        gains[i]  = cells::lift1(delta, [](double d) { return std::max(d, 0.0); });
        losses[i] = cells::lift1(delta, [](double d) { return std::max(-d, 0.0); });
    }

    const Column avg_gain = simple_moving_average(gains, period);
    const Column avg_loss = simple_moving_average(losses, period);

    Column out(prices.size());
    for (std::size_t i = 0; i < prices.size(); ++i) {
        if (!avg_gain[i] || !avg_loss[i]) {
            continue;
        }
        const double g = *avg_gain[i];
        const double l = *avg_loss[i];
        if (l == 0.0) {
            out[i] = (g > 0.0) ? constants::RSI_ZERO_LOSS_VALUE
                               : constants::RSI_FLAT_VALUE;
            continue;
        }
        out[i] = cells::finite(100.0 - 100.0 / (1.0 + g / l));
    }
    return out;
}

Column rsi(const PriceSeries& series, std::size_t period) {
    return rsi(cells::from_values(series.closes()), period);
}

}  // namespace tafeat::transforms
