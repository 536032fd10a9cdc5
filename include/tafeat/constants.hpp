#pragma once

#include <cstddef>

/// @file include/tafeat/constants.hpp
/// @brief Default indicator parameters and numeric policies.
///
/// Every transform takes its parameters explicitly; these are the named
/// defaults used when a spec string or config omits an option.

namespace tafeat::constants {

// ─── Moving Averages ──────────────────────────────────────────────────────────

/// Short simple moving average window (MA10).
static constexpr std::size_t SHORT_MA_WINDOW = 10;

/// Long simple moving average window (MA50).
static constexpr std::size_t LONG_MA_WINDOW = 50;

/// Default EMA span (EMA20). α = 2 / (span + 1).
static constexpr std::size_t EMA_SPAN = 20;

// ─── Returns / Volatility ─────────────────────────────────────────────────────

/// Default rolling volatility window in returns (needs window + 1 prices).
static constexpr std::size_t VOLATILITY_WINDOW = 20;

/// Smallest window for which the sample (n − 1) standard deviation exists.
static constexpr std::size_t MIN_VOLATILITY_WINDOW = 2;

/// Default compounding period for the cumulated return.
static constexpr std::size_t CUMULATED_RETURN_PERIOD = 5;

// ─── Distance to Average ──────────────────────────────────────────────────────

/// Default MA window for the distance-to-MA feature.
static constexpr std::size_t DISTANCE_MA_WINDOW = 50;

/// Default EMA span for the distance-to-EMA feature.
static constexpr std::size_t DISTANCE_EMA_SPAN = 20;

// ─── RSI ──────────────────────────────────────────────────────────────────────

/// Default RSI lookback in price changes.
static constexpr std::size_t RSI_PERIOD = 14;

/// RSI when the window saw gains but no losses (avg_loss == 0, avg_gain > 0).
static constexpr double RSI_ZERO_LOSS_VALUE = 100.0;

/// RSI when the window saw neither gains nor losses (flat prices).
static constexpr double RSI_FLAT_VALUE = 50.0;

// ─── Labels ───────────────────────────────────────────────────────────────────

/// Default forward horizon in rows for the threshold-horizon labeler.
static constexpr std::size_t LABEL_HORIZON = 10;

/// Default forward-return threshold for the threshold-horizon labeler.
static constexpr double LABEL_THRESHOLD = 0.05;

// ─── Numerical ────────────────────────────────────────────────────────────────

/// General floating-point comparison epsilon used by tests and checks.
static constexpr double FLOAT_EPSILON = 1e-12;

}  // namespace tafeat::constants
