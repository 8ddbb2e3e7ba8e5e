#pragma once

#include "calgebra/field_error.hpp"
#include "calgebra/field_kind.hpp"

#include <limits>
#include <string>

#include <cstdint>

namespace calgebra {

/**
 * Overflow-checked integer arithmetic used by every field.
 *
 * ## Overflow Policy
 * These functions never clamp and never wrap: a result that cannot be
 * represented is reported as
 * FieldErrorCode::arithmetic_overflow. Field arithmetic is performed on an
 * absolute millisecond axis where a silently wrapped instant would be
 * indistinguishable from a valid one.
 *
 * 32-bit variants carry an `_int` suffix so that mixed int/int64_t call
 * sites resolve unambiguously to the 64-bit overloads.
 */

[[nodiscard]] inline FieldResult<int32_t> safe_negate_int(int32_t value) {
    if (value == std::numeric_limits<int32_t>::min()) {
        return make_overflow_error("Integer.MIN_VALUE cannot be negated");
    }
    return -value;
}

[[nodiscard]] inline FieldResult<int64_t> safe_negate(int64_t value) {
    if (value == std::numeric_limits<int64_t>::min()) {
        return make_overflow_error("Long.MIN_VALUE cannot be negated");
    }
    return -value;
}

[[nodiscard]] inline FieldResult<int32_t> safe_add_int(int32_t val1, int32_t val2) {
    int32_t sum = 0;
    if (__builtin_add_overflow(val1, val2, &sum)) {
        return make_overflow_error("The calculation caused an overflow: " + std::to_string(val1) +
                                   " + " + std::to_string(val2));
    }
    return sum;
}

[[nodiscard]] inline FieldResult<int64_t> safe_add(int64_t val1, int64_t val2) {
    int64_t sum = 0;
    if (__builtin_add_overflow(val1, val2, &sum)) {
        return make_overflow_error("The calculation caused an overflow: " + std::to_string(val1) +
                                   " + " + std::to_string(val2));
    }
    return sum;
}

[[nodiscard]] inline FieldResult<int64_t> safe_subtract(int64_t val1, int64_t val2) {
    int64_t diff = 0;
    if (__builtin_sub_overflow(val1, val2, &diff)) {
        return make_overflow_error("The calculation caused an overflow: " + std::to_string(val1) +
                                   " - " + std::to_string(val2));
    }
    return diff;
}

[[nodiscard]] inline FieldResult<int32_t> safe_multiply_int(int32_t val1, int32_t val2) {
    int64_t total = static_cast<int64_t>(val1) * static_cast<int64_t>(val2);
    if (total < std::numeric_limits<int32_t>::min() ||
        total > std::numeric_limits<int32_t>::max()) {
        return make_overflow_error("Multiplication overflows an int: " + std::to_string(val1) +
                                   " * " + std::to_string(val2));
    }
    return static_cast<int32_t>(total);
}

[[nodiscard]] inline FieldResult<int64_t> safe_multiply(int64_t val1, int64_t val2) {
    int64_t total = 0;
    if (__builtin_mul_overflow(val1, val2, &total)) {
        return make_overflow_error("Multiplication overflows a long: " + std::to_string(val1) +
                                   " * " + std::to_string(val2));
    }
    return total;
}

[[nodiscard]] inline FieldResult<int64_t> safe_multiply(int64_t val1, int32_t val2) {
    return safe_multiply(val1, static_cast<int64_t>(val2));
}

[[nodiscard]] inline FieldResult<int64_t> safe_divide(int64_t dividend, int64_t divisor) {
    if (divisor == 0) {
        return make_argument_error("Division by zero");
    }
    if (dividend == std::numeric_limits<int64_t>::min() && divisor == -1) {
        return make_overflow_error("Division overflows a long: " + std::to_string(dividend) +
                                   " / " + std::to_string(divisor));
    }
    return dividend / divisor;
}

[[nodiscard]] inline FieldResult<int32_t> safe_to_int(int64_t value) {
    if (value < std::numeric_limits<int32_t>::min() ||
        value > std::numeric_limits<int32_t>::max()) {
        return make_overflow_error("Value cannot fit in an int: " + std::to_string(value));
    }
    return static_cast<int32_t>(value);
}

[[nodiscard]] inline FieldResult<int32_t> safe_multiply_to_int(int64_t val1, int64_t val2) {
    return safe_multiply(val1, val2).and_then(safe_to_int);
}

/**
 * Wrap a value into the inclusive range [min_value, max_value].
 *
 * The result is congruent to value modulo (max_value - min_value + 1), using
 * Euclidean rather than truncating modulo so negative inputs wrap from the top
 * of the range: get_wrapped_value(-1, 0, 59) == 59.
 *
 * @return The wrapped value, or invalid_argument when min_value >= max_value
 */
[[nodiscard]] inline FieldResult<int32_t> get_wrapped_value(int64_t value, int32_t min_value,
                                                            int32_t max_value) {
    if (min_value >= max_value) {
        return make_argument_error("MIN > MAX");
    }

    int64_t wrap_range = static_cast<int64_t>(max_value) - min_value + 1;
    int64_t offset = value - min_value;
    int64_t wrapped = offset % wrap_range;
    if (wrapped < 0) {
        wrapped += wrap_range;
    }
    return static_cast<int32_t>(wrapped + min_value);
}

/**
 * Add wrap_value to current_value, wrapping into [min_value, max_value].
 *
 * The sum is formed in 64 bits and cannot overflow.
 */
[[nodiscard]] inline FieldResult<int32_t> get_wrapped_value(int32_t current_value,
                                                            int32_t wrap_value, int32_t min_value,
                                                            int32_t max_value) {
    return get_wrapped_value(static_cast<int64_t>(current_value) + wrap_value, min_value,
                             max_value);
}

/**
 * Check a field value against inclusive bounds.
 *
 * @return Success, or invalid_field_value carrying the field kind, value and bounds
 */
[[nodiscard]] inline FieldResult<void> verify_value_bounds(FieldKind field, int64_t value,
                                                           int64_t lower_bound,
                                                           int64_t upper_bound) {
    if (value < lower_bound || value > upper_bound) {
        return make_value_error(field, value, lower_bound, upper_bound);
    }
    return {};
}

} // namespace calgebra
