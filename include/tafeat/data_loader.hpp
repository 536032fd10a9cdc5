#pragma once

/// @file include/tafeat/data_loader.hpp
/// @brief CSV loader for daily OHLCV bars: the acquisition boundary.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Turn a CSV export of daily bars into a validated `PriceSeries`. This sits
/// outside the feature core: the core never performs I/O and only sees the
/// series this loader (or any other collaborator) produces.
///
/// ## Expected CSV Format
/// ```
/// Date,Open,High,Low,Close,Volume
/// 2024-01-02,472.16,473.67,470.49,472.65,123623700
/// 2024-01-03,470.43,471.19,468.17,468.79,103585900
/// ```
/// Columns are located by header name (case-insensitive; the date column may
/// be called `date` or `timestamp`), so extra columns such as `Dividends`
/// are ignored. Anything after the `YYYY-MM-DD` prefix of a date field (a
/// time or zone suffix) is ignored.
///
/// ## Guarantees
/// - Skips individual malformed rows rather than failing the whole load
/// - Never hands an empty series to the core: `load_series` reports
///   `DataUnavailableError` instead
/// - Does not modify any file or external state

#include "tafeat/series.hpp"
#include "tafeat/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tafeat::core {

/// Result of parsing CSV text.
struct ParsedBars {
    std::vector<Bar> bars;          ///< Valid rows in file order
    std::size_t      skipped = 0;   ///< Malformed or invalid data rows

    /// First required column ("date" or "close") the header lacks; set only
    /// when no rows could be read for that reason.
    std::optional<std::string> missing_column;
};

/// Loads daily OHLCV data from CSV files and strings.
class DataLoader {
public:
    /// Load bars from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Parsed bars otherwise (possibly none)
    [[nodiscard]] static std::optional<ParsedBars>
    load_csv(const std::string& filepath);

    /// Parse CSV-formatted text (first non-comment line is the header).
    ///
    /// # Returns
    /// Parsed bars; empty with `missing_column` set if the header lacks a
    /// date or close column.
    [[nodiscard]] static ParsedBars parse_csv_string(std::string_view csv_content);

    /// Load a file and validate it into a series.
    ///
    /// # Throws
    /// - `DataUnavailableError` if the file cannot be opened or yields no rows
    /// - `StructuralError` if the header lacks a required column, or the rows
    ///   are not strictly increasing in time
    [[nodiscard]] static PriceSeries load_series(const std::string& filepath);

    /// Validate a single bar: finite prices, low ≤ open/close ≤ high,
    /// non-negative volume.
    [[nodiscard]] static bool validate_bar(const Bar& bar) noexcept;

    /// Parse the `YYYY-MM-DD` prefix of `text` into a calendar day.
    [[nodiscard]] static std::optional<std::chrono::sys_days>
    parse_date(std::string_view text) noexcept;
};

}  // namespace tafeat::core
