/// @file src/labels/crossover_labeler.cpp
/// @brief Moving-average crossover regime labeler.

#include "tafeat/labels.hpp"
#include "tafeat/transforms.hpp"

#include "detail/validation.hpp"

#include <fmt/format.h>

namespace tafeat::labels {

CrossoverLabeler::CrossoverLabeler(std::size_t short_window, std::size_t long_window)
    : short_window_(short_window), long_window_(long_window)
{
    detail::require_at_least("CrossoverLabeler", "short_window", short_window_, 1);
    detail::require_at_least("CrossoverLabeler", "long_window", long_window_, 1);
    if (short_window_ >= long_window_) {
        throw ParameterError("short_window", fmt::format(
            "CrossoverLabeler: short_window ({}) must be < long_window ({})",
            short_window_, long_window_));
    }
}

std::string CrossoverLabeler::name() const {
    return fmt::format("Label_MA{}x{}", short_window_, long_window_);
}

LabelColumn CrossoverLabeler::label(const PriceSeries& series) const {
    const Column fast = transforms::simple_moving_average(series, short_window_);
    const Column slow = transforms::simple_moving_average(series, long_window_);

    LabelColumn out{.name = name(), .values = std::vector<LabelCell>(series.size())};
    for (std::size_t i = 0; i < series.size(); ++i) {
        // The long average is the binding one: missing before long_window - 1.
        if (!fast[i] || !slow[i]) {
            continue;
        }
        out.values[i] = (*fast[i] > *slow[i]) ? Regime::Bullish : Regime::NonBullish;
    }
    return out;
}

}  // namespace tafeat::labels
