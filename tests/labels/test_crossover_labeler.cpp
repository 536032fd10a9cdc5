/// @file tests/labels/test_crossover_labeler.cpp
/// @brief Tests for the moving-average crossover labeler.

#include "tafeat/labels.hpp"
#include "tafeat/errors.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace tafeat;
using namespace tafeat::labels;

TEST(CrossoverLabeler, MissingUntilLongAverageDefined) {
    std::vector<double> closes;
    for (int i = 0; i < 10; ++i) closes.push_back(100.0 + i);
    auto labels = CrossoverLabeler(2, 5).label(PriceSeries::from_closes(closes));
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_FALSE(labels.values[i].has_value()) << "row " << i;
    }
    EXPECT_EQ(labels.valid_count(), 6u);
}

TEST(CrossoverLabeler, RisingSeriesIsBullish) {
    std::vector<double> closes;
    for (int i = 0; i < 60; ++i) closes.push_back(100.0 + i);
    auto labels = CrossoverLabeler(10, 50).label(PriceSeries::from_closes(closes));
    EXPECT_EQ(labels.name, "Label_MA10x50");
    EXPECT_EQ(labels.count(Regime::Bullish), 11u);
    EXPECT_EQ(labels.valid_count(), 11u);
}

TEST(CrossoverLabeler, FallingSeriesIsNonBullish) {
    std::vector<double> closes;
    for (int i = 0; i < 20; ++i) closes.push_back(200.0 - i);
    auto labels = CrossoverLabeler(3, 6).label(PriceSeries::from_closes(closes));
    EXPECT_EQ(labels.count(Regime::NonBullish), labels.valid_count());
}

TEST(CrossoverLabeler, EqualAveragesAreNonBullish) {
    std::vector<double> closes(12, 50.0);
    auto labels = CrossoverLabeler(2, 4).label(PriceSeries::from_closes(closes));
    EXPECT_EQ(labels.count(Regime::NonBullish), 9u);
}

TEST(CrossoverLabeler, InvertedWindowsRejected) {
    try {
        CrossoverLabeler(50, 10);
        FAIL() << "expected ParameterError";
    } catch (const ParameterError& e) {
        EXPECT_EQ(e.parameter(), "short_window");
    }
    EXPECT_THROW(CrossoverLabeler(10, 10), ParameterError);
    EXPECT_THROW(CrossoverLabeler(0, 10), ParameterError);
}

TEST(CrossoverLabeler, FactoryDefaults) {
    auto labeler = make_labeler("crossover");
    EXPECT_EQ(labeler->name(), "Label_MA10x50");
    EXPECT_THROW((void)make_labeler("crossover short=30 long=20"), ParameterError);
}

TEST(Regime, DisplayNames) {
    EXPECT_EQ(to_string(Regime::Bullish), "Bullish");
    EXPECT_EQ(to_string(Regime::NonBullish), "Non-Bullish");
    EXPECT_EQ(to_string(Regime::Range), "Range");
}
