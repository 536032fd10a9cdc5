/// @file tests/core/test_data_loader.cpp
/// @brief Tests for CSV parsing, bar validation and series loading.

#include "tafeat/data_loader.hpp"
#include "tafeat/errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <limits>
#include <string>

using namespace tafeat;
using namespace tafeat::core;
using namespace std::chrono;

// ─── parse_date ───────────────────────────────────────────────────────────────

TEST(ParseDate, PlainAndSuffixed) {
    const sys_days expected{year{2024} / January / 2};
    EXPECT_EQ(DataLoader::parse_date("2024-01-02"), expected);
    EXPECT_EQ(DataLoader::parse_date("2024-01-02 00:00:00-05:00"), expected);
    EXPECT_EQ(DataLoader::parse_date("2024-01-02T16:00:00Z"), expected);
}

TEST(ParseDate, RejectsMalformed) {
    EXPECT_FALSE(DataLoader::parse_date("2024/01/02").has_value());
    EXPECT_FALSE(DataLoader::parse_date("2024-13-02").has_value());
    EXPECT_FALSE(DataLoader::parse_date("2023-02-29").has_value());
    EXPECT_FALSE(DataLoader::parse_date("2024-01-02X").has_value());
    EXPECT_FALSE(DataLoader::parse_date("").has_value());
}

// ─── validate_bar ─────────────────────────────────────────────────────────────

TEST(ValidateBar, OhlcConsistency) {
    const sys_days day{year{2024} / January / 2};
    EXPECT_TRUE(DataLoader::validate_bar({day, 10, 12, 9, 11, 1000}));
    EXPECT_FALSE(DataLoader::validate_bar({day, 10, 9, 12, 11, 1000}));   // high < low
    EXPECT_FALSE(DataLoader::validate_bar({day, 10, 12, 9, 13, 1000}));   // close > high
    EXPECT_FALSE(DataLoader::validate_bar({day, 10, 12, 9, 11, -1}));     // volume
    EXPECT_FALSE(DataLoader::validate_bar({day, 8, 12, 9, 11, 1000}));    // open < low
    EXPECT_FALSE(DataLoader::validate_bar(
        {day, 10, 12, 9, std::numeric_limits<double>::quiet_NaN(), 1}));
}

// ─── parse_csv_string ─────────────────────────────────────────────────────────

TEST(ParseCsvString, StandardLayout) {
    const auto parsed = DataLoader::parse_csv_string(
        "Date,Open,High,Low,Close,Volume\n"
        "2024-01-02,472.16,473.67,470.49,472.65,123623700\n"
        "2024-01-03,470.43,471.19,468.17,468.79,103585900\n");
    ASSERT_EQ(parsed.bars.size(), 2u);
    EXPECT_EQ(parsed.skipped, 0u);
    EXPECT_DOUBLE_EQ(parsed.bars[1].close, 468.79);
    EXPECT_DOUBLE_EQ(parsed.bars[0].volume, 123623700.0);
}

TEST(ParseCsvString, HeaderLookupByNameWithExtraColumns) {
    const auto parsed = DataLoader::parse_csv_string(
        "# exported\n"
        "timestamp,volume,close,dividends\r\n"
        "2024-01-02,500,10.5,0\r\n");
    ASSERT_EQ(parsed.bars.size(), 1u);
    const Bar& b = parsed.bars[0];
    EXPECT_DOUBLE_EQ(b.close, 10.5);
    EXPECT_DOUBLE_EQ(b.open, 10.5);   // absent → close
    EXPECT_DOUBLE_EQ(b.high, 10.5);
    EXPECT_DOUBLE_EQ(b.volume, 500.0);
}

TEST(ParseCsvString, MalformedRowsSkippedAndCounted) {
    const auto parsed = DataLoader::parse_csv_string(
        "date,close\n"
        "2024-01-02,10\n"
        "not-a-date,11\n"
        "2024-01-04,abc\n"
        "2024-01-05\n"
        "2024-01-08,12\n");
    EXPECT_EQ(parsed.bars.size(), 2u);
    EXPECT_EQ(parsed.skipped, 3u);
}

TEST(ParseCsvString, HeaderWithoutCloseReportsMissingColumn) {
    const auto parsed = DataLoader::parse_csv_string("date,open\n2024-01-02,1\n");
    EXPECT_TRUE(parsed.bars.empty());
    ASSERT_TRUE(parsed.missing_column.has_value());
    EXPECT_EQ(*parsed.missing_column, "close");
}

TEST(ParseCsvString, HeaderWithoutDateReportsMissingColumn) {
    const auto parsed = DataLoader::parse_csv_string("open,close\n1,2\n");
    ASSERT_TRUE(parsed.missing_column.has_value());
    EXPECT_EQ(*parsed.missing_column, "date");
}

TEST(ParseCsvString, CompleteHeaderHasNoMissingColumn) {
    const auto parsed = DataLoader::parse_csv_string("date,close\n2024-01-02,1\n");
    EXPECT_FALSE(parsed.missing_column.has_value());
}

// ─── load_csv / load_series ───────────────────────────────────────────────────

TEST(LoadCsv, MissingFileIsNullopt) {
    EXPECT_FALSE(DataLoader::load_csv("/nonexistent/bars.csv").has_value());
}

TEST(LoadSeries, MissingFileIsDataUnavailable) {
    EXPECT_THROW((void)DataLoader::load_series("/nonexistent/bars.csv"), DataUnavailableError);
}

TEST(LoadSeries, EmptyFileIsDataUnavailable) {
    const std::string path = ::testing::TempDir() + "tafeat_empty.csv";
    {
        std::ofstream out(path);
        out << "Date,Close\n";
    }
    EXPECT_THROW((void)DataLoader::load_series(path), DataUnavailableError);
    std::remove(path.c_str());
}

TEST(LoadSeries, MissingCloseColumnIsStructuralError) {
    const std::string path = ::testing::TempDir() + "tafeat_no_close.csv";
    {
        std::ofstream out(path);
        out << "Date,Open,High,Low,Volume\n"
               "2024-01-02,10,11,9,100\n"
               "2024-01-03,10,11,9,100\n";
    }
    try {
        (void)DataLoader::load_series(path);
        FAIL() << "expected StructuralError";
    } catch (const StructuralError& e) {
        EXPECT_NE(std::string(e.what()).find("close"), std::string::npos);
    }
    std::remove(path.c_str());
}

TEST(LoadSeries, UnorderedRowsAreStructuralError) {
    const std::string path = ::testing::TempDir() + "tafeat_unordered.csv";
    {
        std::ofstream out(path);
        out << "Date,Close\n2024-01-03,10\n2024-01-02,11\n";
    }
    EXPECT_THROW((void)DataLoader::load_series(path), StructuralError);
    std::remove(path.c_str());
}

TEST(LoadSeries, ValidFile) {
    const std::string path = ::testing::TempDir() + "tafeat_valid.csv";
    {
        std::ofstream out(path);
        out << "Date,Close\n2024-01-02,10\n2024-01-03,11\n2024-01-05,12\n";
    }
    const PriceSeries s = DataLoader::load_series(path);
    EXPECT_EQ(s.size(), 3u);
    EXPECT_DOUBLE_EQ(s.closes()[2], 12.0);
    std::remove(path.c_str());
}
