#include <limits>
#include <utility>

#include <gtest/gtest.h>
#include <calgebra/calgebra.hpp>

using namespace calgebra;

namespace {

constexpr int64_t long_max = std::numeric_limits<int64_t>::max();
constexpr int64_t long_min = std::numeric_limits<int64_t>::min();
constexpr int32_t int_max = std::numeric_limits<int32_t>::max();
constexpr int32_t int_min = std::numeric_limits<int32_t>::min();

// Unwrap a make_*_error helper result into its FieldError
template <typename Unexpected>
FieldError error_of(Unexpected&& unexpected_error) {
    FieldResult<void> result = std::forward<Unexpected>(unexpected_error);
    return result.error();
}

} // namespace

// ==============================================================================
// Overflow-checked arithmetic
// ==============================================================================

TEST(SafeMathTest, AddWithinRange) {
    auto sum = safe_add(long_max - 1, 1);
    ASSERT_TRUE(sum.has_value());
    EXPECT_EQ(*sum, long_max);

    EXPECT_EQ(*safe_add_int(-5, 3), -2);
}

TEST(SafeMathTest, AddOverflow) {
    auto sum = safe_add(long_max, 1);
    ASSERT_FALSE(sum.has_value());
    EXPECT_EQ(sum.error().code, FieldErrorCode::arithmetic_overflow);

    EXPECT_FALSE(safe_add(long_min, -1).has_value());
    EXPECT_FALSE(safe_add_int(int_max, 1).has_value());
}

TEST(SafeMathTest, SubtractOverflow) {
    EXPECT_EQ(*safe_subtract(10, 25), -15);
    auto diff = safe_subtract(long_min, 1);
    ASSERT_FALSE(diff.has_value());
    EXPECT_EQ(diff.error().code, FieldErrorCode::arithmetic_overflow);
    EXPECT_FALSE(safe_subtract(0, long_min).has_value());
}

TEST(SafeMathTest, MultiplyOverflow) {
    EXPECT_EQ(*safe_multiply(int64_t{-3}, int64_t{4}), -12);
    EXPECT_EQ(*safe_multiply(int64_t{1} << 31, int32_t{4}), int64_t{1} << 33);
    EXPECT_FALSE(safe_multiply(long_max / 2 + 1, int64_t{2}).has_value());
    EXPECT_FALSE(safe_multiply(long_min, int64_t{-1}).has_value());

    EXPECT_EQ(*safe_multiply_int(46340, 46340), 2147395600);
    EXPECT_FALSE(safe_multiply_int(65536, 65536).has_value());
}

TEST(SafeMathTest, NegateOverflow) {
    EXPECT_EQ(*safe_negate(long_max), -long_max);
    EXPECT_FALSE(safe_negate(long_min).has_value());
    EXPECT_EQ(*safe_negate_int(7), -7);
    EXPECT_FALSE(safe_negate_int(int_min).has_value());
}

TEST(SafeMathTest, Divide) {
    EXPECT_EQ(*safe_divide(7, -2), -3);

    auto overflow = safe_divide(long_min, -1);
    ASSERT_FALSE(overflow.has_value());
    EXPECT_EQ(overflow.error().code, FieldErrorCode::arithmetic_overflow);

    auto by_zero = safe_divide(1, 0);
    ASSERT_FALSE(by_zero.has_value());
    EXPECT_EQ(by_zero.error().code, FieldErrorCode::invalid_argument);
}

TEST(SafeMathTest, NarrowToInt) {
    EXPECT_EQ(*safe_to_int(-5), -5);
    EXPECT_EQ(*safe_to_int(int_min), int_min);
    EXPECT_FALSE(safe_to_int(int64_t{int_max} + 1).has_value());
    EXPECT_FALSE(safe_to_int(int64_t{int_min} - 1).has_value());

    EXPECT_EQ(*safe_multiply_to_int(1 << 15, 1 << 15), 1 << 30);
    EXPECT_FALSE(safe_multiply_to_int(1 << 20, 1 << 12).has_value());
}

// ==============================================================================
// Wrapping
// ==============================================================================

TEST(SafeMathTest, WrappedValueStaysInRange) {
    EXPECT_EQ(*get_wrapped_value(-1, 0, 59), 59);
    EXPECT_EQ(*get_wrapped_value(60, 0, 59), 0);
    EXPECT_EQ(*get_wrapped_value(121, 0, 59), 1);
    EXPECT_EQ(*get_wrapped_value(-121, 0, 59), 59);
    EXPECT_EQ(*get_wrapped_value(13, 1, 12), 1);
    EXPECT_EQ(*get_wrapped_value(0, 1, 12), 12);
}

TEST(SafeMathTest, WrappedValueWithDelta) {
    EXPECT_EQ(*get_wrapped_value(30, 5, 1, 30), 5);
    EXPECT_EQ(*get_wrapped_value(1, -1, 1, 12), 12);
    EXPECT_EQ(*get_wrapped_value(int_max, 1, int_min, int_max), int_min);
    EXPECT_EQ(*get_wrapped_value(int_min, -1, int_min, int_max), int_max);
}

TEST(SafeMathTest, WrappedValueIsCongruent) {
    for (int64_t value = -500; value <= 500; value += 7) {
        auto wrapped = get_wrapped_value(value, -3, 9);
        ASSERT_TRUE(wrapped.has_value());
        EXPECT_GE(*wrapped, -3);
        EXPECT_LE(*wrapped, 9);
        EXPECT_EQ((value - *wrapped) % 13, 0) << "value " << value;
    }
}

TEST(SafeMathTest, WrappedValueRejectsEmptyRange) {
    auto wrapped = get_wrapped_value(5, 3, 3);
    ASSERT_FALSE(wrapped.has_value());
    EXPECT_EQ(wrapped.error().code, FieldErrorCode::invalid_argument);
    EXPECT_FALSE(get_wrapped_value(5, 0, 4, 1).has_value());
}

// ==============================================================================
// Bounds and error descriptions
// ==============================================================================

TEST(SafeMathTest, VerifyValueBounds) {
    EXPECT_TRUE(verify_value_bounds(FieldKind::month_of_year, 12, 1, 12).has_value());

    auto result = verify_value_bounds(FieldKind::month_of_year, 13, 1, 12);
    ASSERT_FALSE(result.has_value());
    const FieldError& error = result.error();
    EXPECT_EQ(error.code, FieldErrorCode::invalid_field_value);
    EXPECT_EQ(error.field, FieldKind::month_of_year);
    EXPECT_EQ(error.value, 13);
    EXPECT_EQ(error.lower_bound, 1);
    EXPECT_EQ(error.upper_bound, 12);
    EXPECT_EQ(error.describe(), "Value 13 for monthOfYear must be in the range [1,12]");
}

TEST(SafeMathTest, DescribeWithMissingBounds) {
    EXPECT_EQ(error_of(make_value_error(FieldKind::year, 0, std::nullopt, std::nullopt)).describe(),
              "Value 0 for year is not supported");
    EXPECT_EQ(error_of(make_value_error(FieldKind::hour_of_day, -1, 0, std::nullopt)).describe(),
              "Value -1 for hourOfDay must not be smaller than 0");
    EXPECT_EQ(error_of(make_value_error(FieldKind::hour_of_day, 24, std::nullopt, 23)).describe(),
              "Value 24 for hourOfDay must not be larger than 23");
}

TEST(SafeMathTest, DescribeOtherErrors) {
    EXPECT_EQ(error_of(make_unsupported_error(DurationKind::weeks)).describe(),
              "Unsupported operation [weeks]: weeks field is unsupported");
    EXPECT_EQ(error_of(make_argument_error("MIN > MAX")).describe(), "Invalid argument: MIN > MAX");
    EXPECT_STREQ(error_of(make_overflow_error("x")).message(), "Arithmetic overflow");
}

// ==============================================================================
// Floor helpers
// ==============================================================================

TEST(FloorMathTest, FloorDivAndMod) {
    EXPECT_EQ(detail::floor_div(-43, 100), -1);
    EXPECT_EQ(detail::floor_mod(-43, 100), 57);
    EXPECT_EQ(detail::floor_div(-100, 100), -1);
    EXPECT_EQ(detail::floor_mod(-100, 100), 0);
    EXPECT_EQ(detail::floor_div(1969, 100), 19);
    EXPECT_EQ(detail::floor_mod(1969, 100), 69);
    EXPECT_EQ(detail::floor_div(int64_t{-1}, int64_t{1000}), -1);
    EXPECT_EQ(detail::floor_mod(int64_t{-1}, int64_t{1000}), 999);

    for (int32_t value = -250; value <= 250; ++value) {
        EXPECT_EQ(detail::floor_div(value, 12) * 12 + detail::floor_mod(value, 12), value);
    }
}

TEST(FloorMathTest, Alignment) {
    EXPECT_EQ(*detail::align_floor(1500, 1000), 1000);
    EXPECT_EQ(*detail::align_floor(-1, 1000), -1000);
    EXPECT_EQ(*detail::align_floor(-1000, 1000), -1000);
    EXPECT_EQ(*detail::align_ceiling(1, 1000), 1000);
    EXPECT_EQ(*detail::align_ceiling(0, 1000), 0);
    EXPECT_EQ(*detail::align_ceiling(-1, 1000), 0);
    EXPECT_EQ(*detail::align_ceiling(-1001, 1000), -1000);
    EXPECT_EQ(detail::align_remainder(-1, 1000), 999);
    EXPECT_EQ(detail::align_remainder(2500, 1000), 500);
}

TEST(FloorMathTest, AlignmentAtRangeLimits) {
    auto below = detail::align_floor(long_min, 3600000);
    ASSERT_FALSE(below.has_value());
    EXPECT_EQ(below.error().code, FieldErrorCode::arithmetic_overflow);

    auto above = detail::align_ceiling(long_max, 3600000);
    ASSERT_FALSE(above.has_value());
    EXPECT_EQ(above.error().code, FieldErrorCode::arithmetic_overflow);

    // Multiples that still fit are returned
    EXPECT_EQ(*detail::align_floor(long_max, 3600000), long_max - long_max % 3600000);
    EXPECT_EQ(*detail::align_ceiling(long_min, 3600000), long_min - long_min % 3600000);
    EXPECT_EQ(detail::align_remainder(long_min, 1000), 192);
}
