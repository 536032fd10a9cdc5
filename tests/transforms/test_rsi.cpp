/// @file tests/transforms/test_rsi.cpp
/// @brief Tests for the Relative Strength Index and its zero-loss policy.

#include "tafeat/transforms.hpp"
#include "tafeat/constants.hpp"
#include "tafeat/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace tafeat;
using namespace tafeat::transforms;
using namespace tafeat::constants;

TEST(Rsi, FirstDefinedAtPeriod) {
    std::vector<double> closes{10, 11, 10.5, 11.5, 12, 11};
    auto r = rsi(PriceSeries::from_closes(closes), 3);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_FALSE(r[i].has_value()) << "row " << i;
    }
    EXPECT_TRUE(r[3].has_value());
}

TEST(Rsi, HandComputedValue) {
    // Changes over rows 1..3: +1, -0.5, +1 → avg_gain = 2/3, avg_loss = 1/6.
    std::vector<double> closes{10, 11, 10.5, 11.5};
    auto r = rsi(PriceSeries::from_closes(closes), 3);
    const double rs = (2.0 / 3.0) / (0.5 / 3.0);
    EXPECT_NEAR(*r[3], 100.0 - 100.0 / (1.0 + rs), 1e-9);  // = 80
}

TEST(Rsi, StrictlyIncreasingResolvesToZeroLossPolicy) {
    std::vector<double> closes;
    for (int i = 0; i < 40; ++i) closes.push_back(100.0 + i);
    auto r = rsi(PriceSeries::from_closes(closes), 14);
    for (std::size_t i = 14; i < closes.size(); ++i) {
        ASSERT_TRUE(r[i].has_value()) << "row " << i;
        EXPECT_TRUE(std::isfinite(*r[i]));
        EXPECT_DOUBLE_EQ(*r[i], RSI_ZERO_LOSS_VALUE);
    }
}

TEST(Rsi, StrictlyDecreasingIsZero) {
    std::vector<double> closes;
    for (int i = 0; i < 20; ++i) closes.push_back(100.0 - i);
    auto r = rsi(PriceSeries::from_closes(closes), 5);
    EXPECT_NEAR(*r[10], 0.0, 1e-12);
}

TEST(Rsi, FlatWindowResolvesToFlatPolicy) {
    std::vector<double> closes(10, 42.0);
    auto r = rsi(PriceSeries::from_closes(closes), 4);
    ASSERT_TRUE(r[4].has_value());
    EXPECT_DOUBLE_EQ(*r[4], RSI_FLAT_VALUE);
}

TEST(Rsi, BoundedBetweenZeroAndHundred) {
    std::vector<double> closes{100, 103, 99, 101, 98, 104, 102, 107, 101, 100, 105};
    auto r = rsi(PriceSeries::from_closes(closes), 4);
    for (const auto& c : r) {
        if (!c) continue;
        EXPECT_GE(*c, 0.0);
        EXPECT_LE(*c, 100.0);
    }
}

TEST(Rsi, ZeroPeriodIsParameterError) {
    auto s = PriceSeries::from_closes(std::vector<double>{1, 2});
    EXPECT_THROW((void)rsi(s, 0), ParameterError);
}
