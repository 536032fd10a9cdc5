#pragma once

/// @file include/tafeat/types.hpp
/// @brief Shared primitive types for the tafeat feature/label pipeline.
///
/// Every module includes this file. It defines the bar record, the cell and
/// column types that carry the missing sentinel, the regime alphabet used by
/// the label constructors, and the Eigen alias used at the training handoff.

#include <Eigen/Dense>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tafeat {

// ─── Bar ──────────────────────────────────────────────────────────────────────

/// A single daily OHLCV bar.
struct Bar {
    std::chrono::sys_days timestamp;  ///< Trading date (no intraday component)
    double open;                      ///< Opening price
    double high;                      ///< High price
    double low;                       ///< Low price
    double close;                     ///< Closing price, never missing
    double volume;                    ///< Traded volume
};

// ─── Cells and Columns ────────────────────────────────────────────────────────

/// One value of a feature column. `std::nullopt` is the missing sentinel:
/// insufficient history, zero denominator or horizon overrun. Never zero.
using Cell = std::optional<double>;

/// A row-aligned sequence of cells, one per bar of the source series.
using Column = std::vector<Cell>;

/// A column together with the name it is published under.
struct NamedColumn {
    std::string name;
    Column      values;
};

// ─── Regime Labels ────────────────────────────────────────────────────────────

/// Forward-looking market-state classes. Binary constructors draw from
/// {Bullish, NonBullish}; the ternary policy draws from {Bull, Bear, Range}.
enum class Regime : std::uint8_t {
    Bullish,
    NonBullish,
    Bull,
    Bear,
    Range,
};

/// Human-readable regime name ("Bullish", "Non-Bullish", "Bull", ...).
[[nodiscard]] std::string_view to_string(Regime regime) noexcept;

/// One label per row; `std::nullopt` where the horizon overruns the series.
using LabelCell = std::optional<Regime>;

/// A named categorical label column.
struct LabelColumn {
    std::string            name;
    std::vector<LabelCell> values;

    /// Number of rows carrying a label.
    [[nodiscard]] std::size_t valid_count() const noexcept;

    /// Number of rows carrying exactly `regime`.
    [[nodiscard]] std::size_t count(Regime regime) const noexcept;
};

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Dense row-major feature matrix handed to a training stage.
/// Missing cells are encoded as quiet NaN at this boundary only.
using FeatureMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

}  // namespace tafeat
