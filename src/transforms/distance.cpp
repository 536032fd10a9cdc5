/// @file src/transforms/distance.cpp
/// @brief Normalized distance of a price column to an average column.

#include "tafeat/transforms.hpp"
#include "tafeat/cell_ops.hpp"

#include "detail/validation.hpp"

namespace tafeat::transforms {

Column distance(std::span<const Cell> price, std::span<const Cell> average) {
    detail::require_same_length("distance", price.size(), average.size());

    Column out(price.size());
    for (std::size_t i = 0; i < price.size(); ++i) {
        // (p - a) / a; cells::div leaves the row missing when a == 0.
        out[i] = cells::div(cells::sub(price[i], average[i]), average[i]);
    }
    return out;
}

}  // namespace tafeat::transforms
