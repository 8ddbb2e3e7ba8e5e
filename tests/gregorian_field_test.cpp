#include "support/gregorian_test_fields.hpp"

#include <gtest/gtest.h>

using namespace calgebra;
using namespace calgebra::test;

// Calendar fields built on the precise and imprecise bases
class GregorianFieldTest : public ::testing::Test {
protected:
    GregorianFields fields = GregorianFields::make();
};

// ==============================================================================
// Day of month (precise duration, variable maximum)
// ==============================================================================

TEST_F(GregorianFieldTest, DayBoundsFollowMonth) {
    const auto& day = *fields.day;
    EXPECT_EQ(*day.min_value(), 1);
    EXPECT_EQ(*day.max_value(), 31);
    EXPECT_EQ(*day.max_value_at(instant_of(2001, 2, 10)), 28);
    EXPECT_EQ(*day.max_value_at(instant_of(2000, 2, 10)), 29);
    EXPECT_EQ(*day.max_value_at(instant_of(2001, 4, 10)), 30);
    EXPECT_EQ(day.range_duration_field(), fields.month->duration_field());
}

TEST_F(GregorianFieldTest, DayWrapStaysInMonth) {
    const auto& day = *fields.day;
    EXPECT_EQ(*day.add_wrap_field(instant_of(2001, 4, 30), 5), instant_of(2001, 4, 5));
    EXPECT_EQ(*day.add_wrap_field(instant_of(2001, 2, 1, 1234), -1), instant_of(2001, 2, 28, 1234));
    EXPECT_EQ(*day.add_wrap_field(instant_of(2001, 1, 31), 31), instant_of(2001, 1, 31));
}

TEST_F(GregorianFieldTest, DayAddCarriesIntoMonth) {
    const auto& day = *fields.day;
    EXPECT_EQ(*day.add(instant_of(2001, 4, 30), 5), instant_of(2001, 5, 5));
    EXPECT_EQ(*day.difference(instant_of(2001, 5, 5), instant_of(2001, 4, 30)), 5);
}

TEST_F(GregorianFieldTest, DaySetUsesMonthLength) {
    const auto& day = *fields.day;
    int64_t instant = instant_of(2001, 2, 10, 7 * millis_per_hour);
    EXPECT_EQ(*day.set(instant, 28), instant_of(2001, 2, 28, 7 * millis_per_hour));

    auto result = day.set(instant, 29);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FieldErrorCode::invalid_field_value);
    EXPECT_EQ(result.error().field, FieldKind::day_of_month);
    EXPECT_EQ(result.error().lower_bound, 1);
    EXPECT_EQ(result.error().upper_bound, 28);
    EXPECT_EQ(result.error().describe(), "Value 29 for dayOfMonth must be in the range [1,28]");

    EXPECT_FALSE(day.set(instant, 0).has_value());
}

TEST_F(GregorianFieldTest, DayRoundsToMidnight) {
    const auto& day = *fields.day;
    int64_t instant = instant_of(2001, 4, 16, 5 * millis_per_hour);
    EXPECT_EQ(*day.round_floor(instant), instant_of(2001, 4, 16));
    EXPECT_EQ(*day.round_ceiling(instant), instant_of(2001, 4, 17));
    EXPECT_EQ(*day.round_half_floor(instant), instant_of(2001, 4, 16));
    EXPECT_EQ(*day.remainder(instant), 5 * millis_per_hour);
}

// ==============================================================================
// Month of year (imprecise)
// ==============================================================================

TEST_F(GregorianFieldTest, MonthWrapKeepsYear) {
    const auto& month = *fields.month;
    EXPECT_EQ(*month.add_wrap_field(instant_of(2001, 12, 15), 1), instant_of(2001, 1, 15));
    EXPECT_EQ(*month.add_wrap_field(instant_of(2001, 1, 31), -1), instant_of(2001, 12, 31));
    EXPECT_EQ(*month.add_wrap_field(instant_of(2001, 1, 31), 1), instant_of(2001, 2, 28));
}

TEST_F(GregorianFieldTest, MonthRoundingTies) {
    const auto& month = *fields.month;
    // April 16th is 15 days from both April 1st and May 1st
    int64_t instant = instant_of(2001, 4, 16);
    EXPECT_EQ(*month.round_floor(instant), instant_of(2001, 4, 1));
    EXPECT_EQ(*month.round_ceiling(instant), instant_of(2001, 5, 1));
    EXPECT_EQ(*month.round_half_floor(instant), instant_of(2001, 4, 1));
    EXPECT_EQ(*month.round_half_ceiling(instant), instant_of(2001, 5, 1));
    EXPECT_EQ(*month.round_half_even(instant), instant_of(2001, 4, 1));

    // March 16th 12:00 is halfway through March; April is even
    int64_t march = instant_of(2001, 3, 16, 12 * millis_per_hour);
    EXPECT_EQ(*month.round_half_even(march), instant_of(2001, 4, 1));
}

TEST_F(GregorianFieldTest, MonthRoundingNearest) {
    const auto& month = *fields.month;
    EXPECT_EQ(*month.round_half_floor(instant_of(2001, 4, 10)), instant_of(2001, 4, 1));
    EXPECT_EQ(*month.round_half_ceiling(instant_of(2001, 4, 20)), instant_of(2001, 5, 1));
    EXPECT_EQ(*month.round_ceiling(instant_of(2001, 4, 1)), instant_of(2001, 4, 1));
    EXPECT_EQ(*month.remainder(instant_of(2001, 4, 3)), 2 * millis_per_day);
}

TEST_F(GregorianFieldTest, MonthSetValidates) {
    const auto& month = *fields.month;
    EXPECT_EQ(*month.set(instant_of(2001, 3, 31), 4), instant_of(2001, 4, 30));
    auto result = month.set(instant_of(2001, 3, 31), 13);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().describe(), "Value 13 for monthOfYear must be in the range [1,12]");
}

// ==============================================================================
// Year (imprecise, leap aware)
// ==============================================================================

TEST_F(GregorianFieldTest, YearLeapQueries) {
    const auto& year = *fields.year;
    EXPECT_TRUE(*year.is_leap(instant_of(2000, 6, 1)));
    EXPECT_FALSE(*year.is_leap(instant_of(1900, 6, 1)));
    EXPECT_TRUE(*year.is_leap(instant_of(2004, 6, 1)));
    EXPECT_EQ(*year.leap_amount(instant_of(2000, 6, 1)), 1);
    EXPECT_EQ(*year.leap_amount(instant_of(2001, 6, 1)), 0);
    EXPECT_EQ(year.leap_duration_field(), days_duration());
}

TEST_F(GregorianFieldTest, NonLeapFieldsUseDefaults) {
    EXPECT_FALSE(*fields.month->is_leap(instant_of(2000, 2, 1)));
    EXPECT_EQ(*fields.month->leap_amount(instant_of(2000, 2, 1)), 0);
    EXPECT_EQ(fields.month->leap_duration_field(), nullptr);
}

TEST_F(GregorianFieldTest, YearRounding) {
    const auto& year = *fields.year;
    int64_t instant = instant_of(1969, 7, 20);
    EXPECT_EQ(*year.round_floor(instant), instant_of(1969, 1, 1));
    EXPECT_EQ(*year.round_ceiling(instant), instant_of(1970, 1, 1));
    EXPECT_EQ(*year.round_half_even(instant), instant_of(1970, 1, 1));
    EXPECT_EQ(*year.round_half_floor(instant_of(1969, 3, 1)), instant_of(1969, 1, 1));
}
