#pragma once

/// @file include/tafeat/cell_ops.hpp
/// @brief Missing-value propagation rules for feature cells.
///
/// # Rules
/// - Any operation with a missing operand yields missing.
/// - A non-finite result (inf, NaN) is never stored: it becomes missing.
/// - Division by an exact zero yields missing.
///
/// Transforms combine cells only through these helpers so the rules are
/// stated once rather than inherited from IEEE NaN arithmetic.

#include "tafeat/types.hpp"

#include <cmath>
#include <cstddef>
#include <span>

namespace tafeat::cells {

/// Wrap a raw double, mapping NaN/inf to missing.
[[nodiscard]] inline Cell finite(double value) noexcept {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

/// Apply `fn(a, b)` when both operands are present.
template <typename Fn>
[[nodiscard]] Cell lift2(const Cell& a, const Cell& b, Fn&& fn) noexcept {
    if (!a || !b) {
        return std::nullopt;
    }
    return finite(fn(*a, *b));
}

/// Apply `fn(a)` when the operand is present.
template <typename Fn>
[[nodiscard]] Cell lift1(const Cell& a, Fn&& fn) noexcept {
    if (!a) {
        return std::nullopt;
    }
    return finite(fn(*a));
}

[[nodiscard]] inline Cell add(const Cell& a, const Cell& b) noexcept {
    return lift2(a, b, [](double x, double y) { return x + y; });
}

[[nodiscard]] inline Cell sub(const Cell& a, const Cell& b) noexcept {
    return lift2(a, b, [](double x, double y) { return x - y; });
}

[[nodiscard]] inline Cell mul(const Cell& a, const Cell& b) noexcept {
    return lift2(a, b, [](double x, double y) { return x * y; });
}

/// a / b; missing when b == 0.
[[nodiscard]] inline Cell div(const Cell& a, const Cell& b) noexcept {
    if (!a || !b || *b == 0.0) {
        return std::nullopt;
    }
    return finite(*a / *b);
}

/// ln(a); missing when a ≤ 0.
[[nodiscard]] inline Cell log(const Cell& a) noexcept {
    if (!a || *a <= 0.0) {
        return std::nullopt;
    }
    return finite(std::log(*a));
}

/// True when every cell in `window` is present.
[[nodiscard]] inline bool all_present(std::span<const Cell> window) noexcept {
    for (const Cell& c : window) {
        if (!c) return false;
    }
    return true;
}

/// Number of missing cells in `column`.
[[nodiscard]] inline std::size_t missing_count(std::span<const Cell> column) noexcept {
    std::size_t n = 0;
    for (const Cell& c : column) {
        if (!c) ++n;
    }
    return n;
}

/// Lift a plain price vector into a fully present column.
[[nodiscard]] inline Column from_values(std::span<const double> values) {
    Column out;
    out.reserve(values.size());
    for (double v : values) {
        out.push_back(finite(v));
    }
    return out;
}

}  // namespace tafeat::cells
