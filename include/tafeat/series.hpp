#pragma once

/// @file include/tafeat/series.hpp
/// @brief PriceSeries: validated, immutable daily OHLCV input.
///
/// # Module: Price Series
///
/// ## Responsibility
/// Hold an ordered batch of daily bars and guarantee the structural
/// invariants every transform relies on:
///   - at least one bar
///   - timestamps strictly increasing (no duplicates)
///   - every close finite
///
/// Gaps in the calendar (weekends, holidays, halts) are not filled: an absent
/// trading day is an absent row, and "previous row" always means the previous
/// bar, not the previous calendar day.
///
/// ## Guarantees
/// - Construction validates and throws `StructuralError` on violation
/// - Immutable after construction; transforms read it through const refs
/// - Column views (`closes()`, ...) are stable for the series' lifetime

#include "tafeat/types.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tafeat {

class PriceSeries {
public:
    /// Validate and take ownership of `bars`.
    ///
    /// # Throws
    /// `StructuralError` if `bars` is empty, a timestamp does not strictly
    /// increase, or a close is NaN/inf.
    explicit PriceSeries(std::vector<Bar> bars);

    /// Convenience for synthetic data: one bar per close, consecutive days
    /// starting at `first_day`, open = high = low = close, volume = 0.
    [[nodiscard]] static PriceSeries
    from_closes(std::span<const double> closes,
                std::chrono::sys_days first_day = std::chrono::sys_days{});

    [[nodiscard]] std::size_t size() const noexcept { return bars_.size(); }

    [[nodiscard]] const Bar& operator[](std::size_t i) const noexcept { return bars_[i]; }

    [[nodiscard]] std::span<const Bar> bars() const noexcept { return bars_; }

    [[nodiscard]] std::span<const double> opens()   const noexcept { return opens_; }
    [[nodiscard]] std::span<const double> highs()   const noexcept { return highs_; }
    [[nodiscard]] std::span<const double> lows()    const noexcept { return lows_; }
    [[nodiscard]] std::span<const double> closes()  const noexcept { return closes_; }
    [[nodiscard]] std::span<const double> volumes() const noexcept { return volumes_; }

    [[nodiscard]] std::span<const std::chrono::sys_days> timestamps() const noexcept {
        return timestamps_;
    }

    /// Price column by name ("open", "high", "low", "close", "volume").
    /// Returns an empty span for any other name.
    [[nodiscard]] std::span<const double> price_column(std::string_view name) const noexcept;

    /// Names of the price columns, in table seeding order.
    [[nodiscard]] static std::span<const std::string_view> price_column_names() noexcept;

private:
    std::vector<Bar>                   bars_;
    std::vector<std::chrono::sys_days> timestamps_;
    std::vector<double>                opens_;
    std::vector<double>                highs_;
    std::vector<double>                lows_;
    std::vector<double>                closes_;
    std::vector<double>                volumes_;
};

/// Format a trading date as ISO `YYYY-MM-DD`.
[[nodiscard]] std::string format_date(std::chrono::sys_days day);

}  // namespace tafeat
