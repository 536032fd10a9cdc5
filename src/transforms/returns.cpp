/// @file src/transforms/returns.cpp
/// @brief Simple, log and cumulated returns.

#include "tafeat/transforms.hpp"
#include "tafeat/cell_ops.hpp"

#include "detail/validation.hpp"

#include <cmath>

namespace tafeat::transforms {

// ─── simple_return ────────────────────────────────────────────────────────────

Column simple_return(std::span<const Cell> prices) {
    Column out(prices.size());
    for (std::size_t i = 1; i < prices.size(); ++i) {
        // p[i] / p[i-1] - 1; a zero previous price leaves the row missing.
        out[i] = cells::lift1(cells::div(prices[i], prices[i - 1]),
                              [](double ratio) { return ratio - 1.0; });
    }
    return out;
}

Column simple_return(const PriceSeries& series) {
    return simple_return(cells::from_values(series.closes()));
}

// ─── log_return ───────────────────────────────────────────────────────────────

Column log_return(std::span<const Cell> simple_returns) {
    Column out(simple_returns.size());
    for (std::size_t i = 0; i < simple_returns.size(); ++i) {
        // ln(1 + r) is undefined for r ≤ -1; cells::log maps that to missing.
        out[i] = cells::log(cells::lift1(simple_returns[i],
                                         [](double r) { return 1.0 + r; }));
    }
    return out;
}

Column log_return(const PriceSeries& series) {
    return log_return(simple_return(series));
}

// ─── cumulated_return ─────────────────────────────────────────────────────────

Column cumulated_return(std::span<const Cell> simple_returns, std::size_t period) {
    detail::require_at_least("cumulated_return", "period", period, 1);

    Column out(simple_returns.size());
    if (simple_returns.size() < period) {
        return out;
    }

    for (std::size_t i = period - 1; i < simple_returns.size(); ++i) {
        const auto win = simple_returns.subspan(i + 1 - period, period);
        if (!cells::all_present(win)) {
            continue;
        }
        double growth = 1.0;
        for (const Cell& r : win) {
            growth *= 1.0 + *r;
        }
        out[i] = cells::finite(growth - 1.0);
    }
    return out;
}

Column cumulated_return(const PriceSeries& series, std::size_t period) {
    return cumulated_return(simple_return(series), period);
}

}  // namespace tafeat::transforms
