#pragma once

/// @file src/detail/validation.hpp
/// @brief Internal argument checks shared by transforms and labelers.

#include "tafeat/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>

namespace tafeat::detail {

/// Throw ParameterError unless `value` ≥ `minimum`.
inline void require_at_least(std::string_view who,
                             std::string_view parameter,
                             std::size_t value,
                             std::size_t minimum) {
    if (value < minimum) {
        throw ParameterError(std::string(parameter), fmt::format(
            "{}: {} must be >= {} (got {})", who, parameter, minimum, value));
    }
}

/// Throw ParameterError unless `value` is finite and strictly positive.
inline void require_positive(std::string_view who,
                             std::string_view parameter,
                             double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw ParameterError(std::string(parameter), fmt::format(
            "{}: {} must be a positive finite number (got {})", who, parameter, value));
    }
}

/// Throw StructuralError unless two row-aligned inputs have equal length.
inline void require_same_length(std::string_view who,
                                std::size_t lhs,
                                std::size_t rhs) {
    if (lhs != rhs) {
        throw StructuralError(fmt::format(
            "{}: inputs are not row-aligned ({} vs {} rows)", who, lhs, rhs));
    }
}

}  // namespace tafeat::detail
