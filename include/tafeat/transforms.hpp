#pragma once

/// @file include/tafeat/transforms.hpp
/// @brief Causal column transforms: moving averages, returns, volatility,
///        distance-to-average and RSI.
///
/// # Module: Feature Transforms
///
/// ## Responsibility
/// Pure functions from one or two row-aligned columns to a new column of the
/// same length. Row i of every output depends only on input rows ≤ i.
///
/// ## Missing Values
/// Inputs and outputs are `Column`s of `std::optional<double>`. Leading rows
/// without enough history are missing, never zero. A window that contains a
/// missing input produces a missing output. See `cell_ops.hpp` for the
/// propagation rules.
///
/// ## Parameters
/// Window/period/span arguments are validated on every call; a zero (or, for
/// volatility, a value below 2) throws `ParameterError` naming the argument.
/// Mismatched input lengths throw `StructuralError`.
///
/// ## Guarantees
/// - Deterministic: the same inputs give bit-identical outputs
/// - Inputs are never modified
/// - Output length == input length

#include "tafeat/series.hpp"
#include "tafeat/types.hpp"

#include <cstddef>
#include <span>

namespace tafeat::transforms {

// ─── Moving-Average Family ────────────────────────────────────────────────────

/// Row i = mean(x[i-window+1 .. i]) for i ≥ window-1, else missing.
[[nodiscard]] Column
simple_moving_average(std::span<const Cell> x, std::size_t window);

/// Simple moving average of the close column.
[[nodiscard]] Column
simple_moving_average(const PriceSeries& series, std::size_t window);

/// Exponentially weighted mean with α = 2 / (span + 1).
///
/// # Convention
/// Bias-adjusted weighting seeded from the first present observation:
///
///     ema[i] = Σ_k (1-α)^k · x[i-k]  /  Σ_k (1-α)^k
///
/// summed over the present observations up to row i, so ema[first] equals
/// x[first] and the early rows are not biased towards zero. Weights decay by
/// absolute row distance. A missing input row yields a missing output at that
/// row; leading missing rows are skipped.
[[nodiscard]] Column
exponential_moving_average(std::span<const Cell> x, std::size_t span);

/// Exponential moving average of the close column.
[[nodiscard]] Column
exponential_moving_average(const PriceSeries& series, std::size_t span);

// ─── Returns Family ───────────────────────────────────────────────────────────

/// r[i] = p[i] / p[i-1] - 1; missing at i = 0 and where p[i-1] == 0.
[[nodiscard]] Column simple_return(std::span<const Cell> prices);

/// Simple close-to-close return of the series.
[[nodiscard]] Column simple_return(const PriceSeries& series);

/// ln(1 + r[i]); missing where r[i] is missing or r[i] ≤ -1.
[[nodiscard]] Column log_return(std::span<const Cell> simple_returns);

/// Log close-to-close return of the series.
[[nodiscard]] Column log_return(const PriceSeries& series);

/// Π_{k=i-period+1..i} (1 + r[k]) - 1 over the `period` most recent returns;
/// missing if any of them is missing.
[[nodiscard]] Column
cumulated_return(std::span<const Cell> simple_returns, std::size_t period);

/// Compounded close-to-close return over `period` bars. First defined at
/// row `period` (r[0] is missing) where it equals close[i]/close[i-period] - 1.
[[nodiscard]] Column
cumulated_return(const PriceSeries& series, std::size_t period);

// ─── Volatility ───────────────────────────────────────────────────────────────

/// Sample (n-1) standard deviation of r[i-window+1 .. i]. `window` ≥ 2.
[[nodiscard]] Column
volatility(std::span<const Cell> simple_returns, std::size_t window);

/// Rolling volatility of close-to-close returns; first defined at row `window`.
[[nodiscard]] Column
volatility(const PriceSeries& series, std::size_t window);

// ─── Distance-to-Average ──────────────────────────────────────────────────────

/// (price[i] - avg[i]) / avg[i]; missing where avg is missing or zero.
[[nodiscard]] Column
distance(std::span<const Cell> price, std::span<const Cell> average);

// ─── Momentum ─────────────────────────────────────────────────────────────────

/// Relative Strength Index over `period` price changes (simple averages).
///
/// # Policy
/// - avg_loss == 0, avg_gain > 0  → RSI_ZERO_LOSS_VALUE (100)
/// - avg_loss == 0, avg_gain == 0 → RSI_FLAT_VALUE (50)
/// - otherwise                    → 100 - 100 / (1 + avg_gain / avg_loss)
///
/// First defined at row `period`.
[[nodiscard]] Column rsi(std::span<const Cell> prices, std::size_t period);

/// RSI of the close column.
[[nodiscard]] Column rsi(const PriceSeries& series, std::size_t period);

}  // namespace tafeat::transforms
