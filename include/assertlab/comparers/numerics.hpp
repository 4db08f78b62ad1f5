#pragma once

/// @file numerics.hpp
/// @brief Mixed-representation numeric comparison with tolerance

#include <cmath>
#include <compare>
#include <utility>

#include <assertlab/core/tolerance.hpp>
#include <assertlab/core/value.hpp>

namespace assertlab::comparers::numerics {

/// Three-way comparison of two numeric values
///
/// Integers compare exactly across signedness; anything involving a double compares
/// as double, so NaN yields `unordered`.
inline std::partial_ordering compare(const core::Value& x, const core::Value& y) {
    using core::ValueKind;
    if (x.is_integral() && y.is_integral()) {
        if (x.kind() == ValueKind::integer && y.kind() == ValueKind::integer) {
            return x.as_integer() <=> y.as_integer();
        }
        if (x.kind() == ValueKind::unsigned_integer && y.kind() == ValueKind::unsigned_integer) {
            return x.as_unsigned() <=> y.as_unsigned();
        }
        if (x.kind() == ValueKind::integer) {
            if (std::cmp_less(x.as_integer(), y.as_unsigned())) {
                return std::partial_ordering::less;
            }
            return std::cmp_equal(x.as_integer(), y.as_unsigned()) ? std::partial_ordering::equivalent
                                                                   : std::partial_ordering::greater;
        }
        if (std::cmp_less(x.as_unsigned(), y.as_integer())) {
            return std::partial_ordering::less;
        }
        return std::cmp_equal(x.as_unsigned(), y.as_integer()) ? std::partial_ordering::equivalent
                                                               : std::partial_ordering::greater;
    }
    return x.to_double() <=> y.to_double();
}

/// Equality of `actual` against `expected` within an already resolved tolerance
///
/// Bounds always come from the expected operand: tolerance describes how far the
/// actual value may stray from what was expected.
inline bool are_equal(const core::Value& expected, const core::Value& actual,
                      const core::Tolerance& tolerance) {
    if (expected.is_floating() && std::isnan(expected.as_double())) {
        return actual.is_floating() && std::isnan(actual.as_double());
    }
    if (actual.is_floating() && std::isnan(actual.as_double())) {
        return false;
    }
    if (expected.is_floating() && std::isinf(expected.as_double())) {
        return compare(expected, actual) == 0;
    }
    if (tolerance.mode() == core::ToleranceMode::none) {
        return compare(expected, actual) == 0;
    }
    core::Range range = tolerance.apply_to_value(expected);
    return compare(range.lower_bound, actual) <= 0 && compare(actual, range.upper_bound) <= 0;
}

} // namespace assertlab::comparers::numerics
