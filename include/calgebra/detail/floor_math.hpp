// include/calgebra/detail/floor_math.hpp
#pragma once

#include "calgebra/safe_math.hpp"

#include <cstdint>

namespace calgebra::detail {

/**
 * Floor-semantics integer helpers shared by the divided, remainder and
 * precise-unit fields.
 *
 * C++ integer division truncates toward zero. Calendar fields need floor
 * semantics so that negative values fall into the correct bucket:
 * year -43 belongs to century -1 (not 0) with year-of-century 57.
 *
 * The formulations below avoid negating the dividend, so INT_MIN inputs do
 * not invoke undefined behavior.
 */

/**
 * Floor division for a non-negative result bucket.
 *
 * floor_div(-43, 100) == -1, floor_div(43, 100) == 0
 *
 * @param value Dividend (any sign)
 * @param divisor Divisor (must be positive)
 * @return Largest q with q * divisor <= value
 */
constexpr int32_t floor_div(int32_t value, int32_t divisor) noexcept {
    if (value >= 0) {
        return value / divisor;
    }
    return ((value + 1) / divisor) - 1;
}

/**
 * Floor modulo companion to floor_div.
 *
 * floor_div(v, d) * d + floor_mod(v, d) == v for every v.
 *
 * @param value Dividend (any sign)
 * @param divisor Divisor (must be positive)
 * @return Remainder in [0, divisor)
 */
constexpr int32_t floor_mod(int32_t value, int32_t divisor) noexcept {
    if (value >= 0) {
        return value % divisor;
    }
    return (divisor - 1) + ((value + 1) % divisor);
}

/// 64-bit floor division (divisor must be positive)
constexpr int64_t floor_div(int64_t value, int64_t divisor) noexcept {
    if (value >= 0) {
        return value / divisor;
    }
    return ((value + 1) / divisor) - 1;
}

/// 64-bit floor modulo (divisor must be positive)
constexpr int64_t floor_mod(int64_t value, int64_t divisor) noexcept {
    if (value >= 0) {
        return value % divisor;
    }
    return (divisor - 1) + ((value + 1) % divisor);
}

/**
 * Align an instant down to a multiple of unit (epoch-aligned floor).
 *
 * @param instant Milliseconds from the epoch
 * @param unit Unit length in milliseconds (>= 1)
 * @return Aligned instant, or arithmetic_overflow when the multiple lies
 *         below the int64_t range
 */
[[nodiscard]] inline FieldResult<int64_t> align_floor(int64_t instant, int64_t unit) {
    if (instant >= 0) {
        return instant - instant % unit;
    }
    instant += 1;
    return safe_subtract(instant - instant % unit, unit);
}

/**
 * Align an instant up to a multiple of unit (epoch-aligned ceiling).
 *
 * Already-aligned instants are returned unchanged. Fails with
 * arithmetic_overflow when the next multiple lies above the int64_t range.
 */
[[nodiscard]] inline FieldResult<int64_t> align_ceiling(int64_t instant, int64_t unit) {
    if (instant > 0) {
        instant -= 1;
        return safe_add(instant - instant % unit, unit);
    }
    return instant - instant % unit;
}

/// Milliseconds past the epoch-aligned floor, in [0, unit)
constexpr int64_t align_remainder(int64_t instant, int64_t unit) noexcept {
    if (instant >= 0) {
        return instant % unit;
    }
    return (instant + 1) % unit + unit - 1;
}

} // namespace calgebra::detail
