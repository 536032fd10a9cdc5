/// @file src/labels/regime.cpp
/// @brief Regime names and LabelColumn counters.

#include "tafeat/types.hpp"

#include <algorithm>

namespace tafeat {

std::string_view to_string(Regime regime) noexcept {
    switch (regime) {
        case Regime::Bullish:    return "Bullish";
        case Regime::NonBullish: return "Non-Bullish";
        case Regime::Bull:       return "Bull";
        case Regime::Bear:       return "Bear";
        case Regime::Range:      return "Range";
    }
    return "Unknown";
}

std::size_t LabelColumn::valid_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(values.begin(), values.end(),
                      [](const LabelCell& c) { return c.has_value(); }));
}

std::size_t LabelColumn::count(Regime regime) const noexcept {
    return static_cast<std::size_t>(
        std::count_if(values.begin(), values.end(),
                      [regime](const LabelCell& c) { return c && *c == regime; }));
}

}  // namespace tafeat
