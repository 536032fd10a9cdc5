#pragma once

/// @file include/tafeat/feature_table.hpp
/// @brief FeatureTable: append-only, row-aligned set of named columns.
///
/// # Invariants
/// - Every column has exactly `rows()` cells
/// - Column names are unique; insertion order is preserved
/// - Columns are only appended, never replaced or mutated
///
/// A table is seeded with the series' price columns ("open", "high", "low",
/// "close", "volume") so transforms can read them by name like any other
/// column.

#include "tafeat/series.hpp"
#include "tafeat/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tafeat::pipeline {

class FeatureTable {
public:
    /// Seed a table with the price columns of `series`.
    explicit FeatureTable(const PriceSeries& series);

    [[nodiscard]] std::size_t rows() const noexcept { return timestamps_.size(); }

    /// Number of columns, price columns included.
    [[nodiscard]] std::size_t width() const noexcept { return columns_.size(); }

    [[nodiscard]] std::span<const std::chrono::sys_days> timestamps() const noexcept {
        return timestamps_;
    }

    [[nodiscard]] bool contains(std::string_view name) const;

    /// # Throws
    /// `ParameterError` if no column is called `name`.
    [[nodiscard]] const Column& column(std::string_view name) const;

    /// Append a column.
    ///
    /// # Throws
    /// - `ParameterError` if a column with the same name already exists
    /// - `StructuralError` if the column length differs from `rows()`
    void add_column(NamedColumn column);

    /// All column names in insertion order.
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }

    /// Column names added after the seeded price columns, in insertion order.
    [[nodiscard]] std::vector<std::string> feature_names() const;

    /// Number of missing cells in column `name`.
    [[nodiscard]] std::size_t missing_count(std::string_view name) const;

    /// Dense rows × names.size() matrix of the requested columns.
    /// Missing cells become quiet NaN.
    [[nodiscard]] FeatureMatrix to_matrix(std::span<const std::string> names) const;

private:
    std::vector<std::chrono::sys_days>                  timestamps_;
    std::vector<std::string>                            names_;
    std::vector<Column>                                 columns_;
    std::map<std::string, std::size_t, std::less<>>     index_;
};

/// Row indices where every column in `names` is present and, if given,
/// `labels` carries a label. Use this to form a training split that excludes
/// warm-up rows and horizon-overrun rows.
///
/// # Throws
/// `StructuralError` if `labels` is not row-aligned with `table`;
/// `ParameterError` for an unknown column name.
[[nodiscard]] std::vector<std::size_t>
complete_rows(const FeatureTable& table,
              std::span<const std::string> names,
              const LabelColumn* labels = nullptr);

}  // namespace tafeat::pipeline
