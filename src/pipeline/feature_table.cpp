/// @file src/pipeline/feature_table.cpp
/// @brief FeatureTable storage, lookup and training-handoff helpers.

#include "tafeat/feature_table.hpp"
#include "tafeat/cell_ops.hpp"
#include "tafeat/errors.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <limits>

namespace tafeat::pipeline {

// ─── FeatureTable constructor ─────────────────────────────────────────────────

FeatureTable::FeatureTable(const PriceSeries& series)
    : timestamps_(series.timestamps().begin(), series.timestamps().end())
{
    for (std::string_view name : PriceSeries::price_column_names()) {
        add_column(NamedColumn{
            .name   = std::string(name),
            .values = cells::from_values(series.price_column(name)),
        });
    }
}

// ─── lookup ───────────────────────────────────────────────────────────────────

bool FeatureTable::contains(std::string_view name) const {
    return index_.find(name) != index_.end();
}

const Column& FeatureTable::column(std::string_view name) const {
    const auto it = index_.find(name);
    if (it == index_.end()) {
        throw ParameterError(std::string(name),
                             fmt::format("feature table has no column '{}'", name));
    }
    return columns_[it->second];
}

// ─── add_column ───────────────────────────────────────────────────────────────

void FeatureTable::add_column(NamedColumn column) {
    if (contains(column.name)) {
        throw ParameterError(column.name, fmt::format(
            "column '{}' already exists; columns are never overwritten", column.name));
    }
    if (column.values.size() != rows()) {
        throw StructuralError(fmt::format(
            "column '{}' has {} cells, table has {} rows",
            column.name, column.values.size(), rows()));
    }
    index_.emplace(column.name, columns_.size());
    names_.push_back(std::move(column.name));
    columns_.push_back(std::move(column.values));
}

// ─── feature_names / missing_count ────────────────────────────────────────────

std::vector<std::string> FeatureTable::feature_names() const {
    const std::size_t seeded = PriceSeries::price_column_names().size();
    if (names_.size() <= seeded) {
        return {};
    }
    return std::vector<std::string>(
        names_.begin() + static_cast<std::ptrdiff_t>(seeded), names_.end());
}

std::size_t FeatureTable::missing_count(std::string_view name) const {
    return cells::missing_count(column(name));
}

// ─── to_matrix ────────────────────────────────────────────────────────────────

FeatureMatrix FeatureTable::to_matrix(std::span<const std::string> names) const {
    FeatureMatrix m(static_cast<Eigen::Index>(rows()),
                    static_cast<Eigen::Index>(names.size()));
    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

    for (std::size_t j = 0; j < names.size(); ++j) {
        const Column& col = column(names[j]);
        for (std::size_t i = 0; i < col.size(); ++i) {
            m(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                col[i].value_or(NaN);
        }
    }
    return m;
}

// ─── complete_rows ────────────────────────────────────────────────────────────

std::vector<std::size_t>
complete_rows(const FeatureTable& table,
              std::span<const std::string> names,
              const LabelColumn* labels) {
    if (labels && labels->values.size() != table.rows()) {
        throw StructuralError(fmt::format(
            "label column '{}' has {} rows, feature table has {}",
            labels->name, labels->values.size(), table.rows()));
    }

    std::vector<const Column*> cols;
    cols.reserve(names.size());
    for (const std::string& n : names) {
        cols.push_back(&table.column(n));
    }

    std::vector<std::size_t> rows;
    for (std::size_t i = 0; i < table.rows(); ++i) {
        bool complete = !labels || labels->values[i].has_value();
        for (const Column* c : cols) {
            if (!complete) break;
            complete = (*c)[i].has_value();
        }
        if (complete) {
            rows.push_back(i);
        }
    }
    return rows;
}

}  // namespace tafeat::pipeline
