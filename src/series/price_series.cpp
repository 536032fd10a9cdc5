/// @file src/series/price_series.cpp
/// @brief PriceSeries validation and column views.

#include "tafeat/series.hpp"
#include "tafeat/errors.hpp"

#include <fmt/format.h>

#include <array>
#include <cmath>

namespace tafeat {

namespace {

constexpr std::array<std::string_view, 5> PRICE_COLUMNS{
    "open", "high", "low", "close", "volume",
};

}  // namespace

// ─── PriceSeries constructor ──────────────────────────────────────────────────

PriceSeries::PriceSeries(std::vector<Bar> bars)
    : bars_(std::move(bars))
{
    if (bars_.empty()) {
        throw StructuralError("price series is empty");
    }

    for (std::size_t i = 0; i < bars_.size(); ++i) {
        const Bar& b = bars_[i];
        if (!std::isfinite(b.close)) {
            throw StructuralError(fmt::format(
                "row {} ({}): close is not a finite number", i, format_date(b.timestamp)));
        }
        if (i > 0 && b.timestamp <= bars_[i - 1].timestamp) {
            throw StructuralError(fmt::format(
                "row {}: timestamp {} does not follow {} (series must be strictly increasing)",
                i, format_date(b.timestamp), format_date(bars_[i - 1].timestamp)));
        }
    }

    const std::size_t n = bars_.size();
    timestamps_.reserve(n);
    opens_.reserve(n);
    highs_.reserve(n);
    lows_.reserve(n);
    closes_.reserve(n);
    volumes_.reserve(n);
    for (const Bar& b : bars_) {
        timestamps_.push_back(b.timestamp);
        opens_.push_back(b.open);
        highs_.push_back(b.high);
        lows_.push_back(b.low);
        closes_.push_back(b.close);
        volumes_.push_back(b.volume);
    }
}

// ─── PriceSeries::from_closes ─────────────────────────────────────────────────

PriceSeries PriceSeries::from_closes(std::span<const double> closes,
                                     std::chrono::sys_days first_day) {
    std::vector<Bar> bars;
    bars.reserve(closes.size());
    for (std::size_t i = 0; i < closes.size(); ++i) {
        const double c = closes[i];
        bars.push_back(Bar{
            .timestamp = first_day + std::chrono::days{static_cast<int>(i)},
            .open      = c,
            .high      = c,
            .low       = c,
            .close     = c,
            .volume    = 0.0,
        });
    }
    return PriceSeries(std::move(bars));
}

// ─── PriceSeries::price_column ────────────────────────────────────────────────

std::span<const double> PriceSeries::price_column(std::string_view name) const noexcept {
    if (name == "open")   return opens_;
    if (name == "high")   return highs_;
    if (name == "low")    return lows_;
    if (name == "close")  return closes_;
    if (name == "volume") return volumes_;
    return {};
}

std::span<const std::string_view> PriceSeries::price_column_names() noexcept {
    return PRICE_COLUMNS;
}

// ─── format_date ──────────────────────────────────────────────────────────────

std::string format_date(std::chrono::sys_days day) {
    const std::chrono::year_month_day ymd{day};
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

}  // namespace tafeat
