/// @file src/transforms/volatility.cpp
/// @brief Rolling sample standard deviation of returns.

#include "tafeat/transforms.hpp"
#include "tafeat/cell_ops.hpp"
#include "tafeat/constants.hpp"

#include "detail/validation.hpp"

#include <Eigen/Dense>

#include <cmath>

namespace tafeat::transforms {

Column volatility(std::span<const Cell> simple_returns, std::size_t window) {
    detail::require_at_least("volatility", "window", window,
                             constants::MIN_VOLATILITY_WINDOW);

    Column out(simple_returns.size());
    if (simple_returns.size() < window) {
        return out;
    }

    Eigen::VectorXd buf(static_cast<Eigen::Index>(window));

    for (std::size_t i = window - 1; i < simple_returns.size(); ++i) {
        const auto win = simple_returns.subspan(i + 1 - window, window);
        if (!cells::all_present(win)) {
            continue;
        }
        for (std::size_t k = 0; k < window; ++k) {
            buf[static_cast<Eigen::Index>(k)] = *win[k];
        }
        const double mean = buf.mean();
        // Bessel-corrected (n-1) sample standard deviation.
        const double sq_sum = (buf.array() - mean).square().sum();
        out[i] = cells::finite(std::sqrt(sq_sum / static_cast<double>(window - 1)));
    }
    return out;
}

Column volatility(const PriceSeries& series, std::size_t window) {
    return volatility(simple_return(series), window);
}

}  // namespace tafeat::transforms
