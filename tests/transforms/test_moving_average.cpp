/// @file tests/transforms/test_moving_average.cpp
/// @brief Tests for simple and exponential moving averages.

#include "tafeat/transforms.hpp"
#include "tafeat/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace tafeat;
using namespace tafeat::transforms;

namespace {

/// Closes 100, 101, ..., 100 + n - 1.
PriceSeries linear_series(std::size_t n) {
    std::vector<double> closes;
    for (std::size_t i = 0; i < n; ++i) closes.push_back(100.0 + static_cast<double>(i));
    return PriceSeries::from_closes(closes);
}

}  // namespace

// ─── simple_moving_average ────────────────────────────────────────────────────

TEST(SimpleMovingAverage, LeadingRowsMissing) {
    auto ma = simple_moving_average(linear_series(20), 5);
    ASSERT_EQ(ma.size(), 20u);
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_FALSE(ma[i].has_value()) << "row " << i;
    }
    EXPECT_TRUE(ma[4].has_value());
}

TEST(SimpleMovingAverage, FirstValueIsMeanOfFirstWindow) {
    auto ma = simple_moving_average(linear_series(20), 10);
    ASSERT_TRUE(ma[9].has_value());
    EXPECT_DOUBLE_EQ(*ma[9], 104.5);  // mean(100..109)
    EXPECT_DOUBLE_EQ(*ma[19], 114.5);
}

TEST(SimpleMovingAverage, WindowOneIsIdentity) {
    auto s = linear_series(5);
    auto ma = simple_moving_average(s, 1);
    for (std::size_t i = 0; i < 5; ++i) {
        ASSERT_TRUE(ma[i].has_value());
        EXPECT_DOUBLE_EQ(*ma[i], s.closes()[i]);
    }
}

TEST(SimpleMovingAverage, WindowLongerThanSeriesAllMissing) {
    auto ma = simple_moving_average(linear_series(5), 10);
    ASSERT_EQ(ma.size(), 5u);
    for (const auto& c : ma) EXPECT_FALSE(c.has_value());
}

TEST(SimpleMovingAverage, MissingInputPropagatesThroughWindow) {
    Column x{1.0, 2.0, std::nullopt, 4.0, 5.0, 6.0};
    auto ma = simple_moving_average(x, 2);
    EXPECT_DOUBLE_EQ(*ma[1], 1.5);
    EXPECT_FALSE(ma[2].has_value());
    EXPECT_FALSE(ma[3].has_value());  // window {missing, 4}
    EXPECT_DOUBLE_EQ(*ma[4], 4.5);
}

TEST(SimpleMovingAverage, ZeroWindowIsParameterError) {
    try {
        (void)simple_moving_average(linear_series(5), 0);
        FAIL() << "expected ParameterError";
    } catch (const ParameterError& e) {
        EXPECT_EQ(e.parameter(), "window");
    }
}

TEST(SimpleMovingAverage, InputNotModified) {
    Column x{1.0, 2.0, 3.0};
    const Column copy = x;
    (void)simple_moving_average(x, 2);
    EXPECT_EQ(x, copy);
}

// ─── exponential_moving_average ───────────────────────────────────────────────

TEST(ExponentialMovingAverage, FirstValueSeededFromFirstObservation) {
    auto ema = exponential_moving_average(linear_series(5), 20);
    ASSERT_TRUE(ema[0].has_value());
    EXPECT_DOUBLE_EQ(*ema[0], 100.0);
}

TEST(ExponentialMovingAverage, BiasAdjustedSecondValue) {
    // span = 3 → α = 0.5; ema[1] = (x1 + 0.5·x0) / (1 + 0.5)
    Column x{2.0, 4.0};
    auto ema = exponential_moving_average(x, 3);
    EXPECT_NEAR(*ema[1], (4.0 + 0.5 * 2.0) / 1.5, 1e-12);
}

TEST(ExponentialMovingAverage, ConstantSeriesStaysConstant) {
    Column x(30, 7.25);
    auto ema = exponential_moving_average(x, 10);
    for (const auto& c : ema) {
        ASSERT_TRUE(c.has_value());
        EXPECT_NEAR(*c, 7.25, 1e-12);
    }
}

TEST(ExponentialMovingAverage, SpanOneTracksInput) {
    // α = 1 → all weight on the current observation.
    Column x{3.0, 9.0, -1.0};
    auto ema = exponential_moving_average(x, 1);
    EXPECT_DOUBLE_EQ(*ema[1], 9.0);
    EXPECT_DOUBLE_EQ(*ema[2], -1.0);
}

TEST(ExponentialMovingAverage, LeadingMissingSkipped) {
    Column x{std::nullopt, std::nullopt, 5.0, 7.0};
    auto ema = exponential_moving_average(x, 3);
    EXPECT_FALSE(ema[0].has_value());
    EXPECT_FALSE(ema[1].has_value());
    ASSERT_TRUE(ema[2].has_value());
    EXPECT_DOUBLE_EQ(*ema[2], 5.0);
    EXPECT_NEAR(*ema[3], (7.0 + 0.5 * 5.0) / 1.5, 1e-12);
}

TEST(ExponentialMovingAverage, InteriorMissingDecaysByPosition) {
    // span = 3 → α = 0.5. Row 1 missing; row 2 weights x0 by 0.25.
    Column x{4.0, std::nullopt, 8.0};
    auto ema = exponential_moving_average(x, 3);
    EXPECT_FALSE(ema[1].has_value());
    EXPECT_NEAR(*ema[2], (8.0 + 0.25 * 4.0) / 1.25, 1e-12);
}

TEST(ExponentialMovingAverage, ZeroSpanIsParameterError) {
    EXPECT_THROW((void)exponential_moving_average(linear_series(3), 0), ParameterError);
}

TEST(ExponentialMovingAverage, RunTwiceBitIdentical) {
    auto s = linear_series(200);
    auto a = exponential_moving_average(s, 20);
    auto b = exponential_moving_average(s, 20);
    EXPECT_EQ(a, b);
}
