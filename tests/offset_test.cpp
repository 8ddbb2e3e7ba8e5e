#include "support/gregorian_test_fields.hpp"

#include <gtest/gtest.h>

using namespace calgebra;
using namespace calgebra::test;

// Test fixture for OffsetDateTimeField over hour-of-day and year
class OffsetFieldTest : public ::testing::Test {
protected:
    void SetUp() override {
        hour = *PreciseDateTimeField::create(FieldKind::hour_of_day, hours_duration(),
                                             days_duration());
        auto shifted = OffsetDateTimeField::create(hour, 1);
        ASSERT_TRUE(shifted.has_value()) << shifted.error().describe();
        hour_plus_one = *shifted;
    }

    GregorianFields fields = GregorianFields::make();
    std::shared_ptr<const PreciseDateTimeField> hour;
    OffsetDateTimeField::FieldPtr hour_plus_one;
};

TEST_F(OffsetFieldTest, ShiftsBounds) {
    EXPECT_EQ(hour_plus_one->type(), FieldKind::hour_of_day);
    EXPECT_EQ(hour_plus_one->offset(), 1);
    EXPECT_EQ(*hour_plus_one->min_value(), 1);
    EXPECT_EQ(*hour_plus_one->max_value(), 24);
    EXPECT_EQ(hour_plus_one->duration_field(), hours_duration());
    EXPECT_EQ(hour_plus_one->range_duration_field(), days_duration());
}

TEST_F(OffsetFieldTest, GetAndSet) {
    EXPECT_EQ(*hour_plus_one->get(0), 1);
    EXPECT_EQ(*hour_plus_one->get(23 * millis_per_hour), 24);

    int64_t instant = 5 * millis_per_hour + 1234;
    EXPECT_EQ(*hour_plus_one->set(instant, 24), 23 * millis_per_hour + 1234);
    EXPECT_EQ(*hour_plus_one->set(instant, 1), 1234);

    auto result = hour_plus_one->set(instant, 0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FieldErrorCode::invalid_field_value);
    EXPECT_EQ(result.error().lower_bound, 1);
    EXPECT_EQ(result.error().upper_bound, 24);
}

TEST_F(OffsetFieldTest, AddWrapFieldUsesShiftedRange) {
    int64_t late = 23 * millis_per_hour;
    EXPECT_EQ(*hour_plus_one->add_wrap_field(late, 1), 0);
    EXPECT_EQ(*hour_plus_one->get(*hour_plus_one->add_wrap_field(late, 1)), 1);
    EXPECT_EQ(*hour_plus_one->add_wrap_field(0, -1), late);
}

TEST_F(OffsetFieldTest, RoundingDelegates) {
    int64_t instant = 13 * millis_per_hour + 30 * millis_per_minute;
    EXPECT_EQ(*hour_plus_one->round_floor(instant), 13 * millis_per_hour);
    EXPECT_EQ(*hour_plus_one->round_ceiling(instant), 14 * millis_per_hour);
    EXPECT_EQ(*hour_plus_one->round_half_even(instant), *hour->round_half_even(instant));
    EXPECT_EQ(*hour_plus_one->remainder(instant), 30 * millis_per_minute);
}

TEST_F(OffsetFieldTest, NarrowedYearRejectsAddPastLimit) {
    auto narrowed = OffsetDateTimeField::create(fields.year, FieldKind::year_of_era, 1, 1, 50000);
    ASSERT_TRUE(narrowed.has_value()) << narrowed.error().describe();
    const auto& field = **narrowed;

    EXPECT_EQ(*field.min_value(), 1);
    EXPECT_EQ(*field.max_value(), 50000);
    EXPECT_EQ(*field.get(instant_of(1969, 7, 20)), 1970);

    int64_t instant = instant_of(49998, 7, 20);
    auto ok = field.add(instant, 1);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*field.get(*ok), 50000);

    auto result = field.add(*ok, 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FieldErrorCode::invalid_field_value);
    EXPECT_EQ(result.error().field, FieldKind::year_of_era);
    EXPECT_EQ(result.error().value, 50001);
}

TEST_F(OffsetFieldTest, LimitsNeverWidenWrappedRange) {
    auto clamped = OffsetDateTimeField::create(hour, FieldKind::clockhour_of_day, 1, -5, 100);
    ASSERT_TRUE(clamped.has_value());
    EXPECT_EQ(*(*clamped)->min_value(), 1);
    EXPECT_EQ(*(*clamped)->max_value(), 24);
}

TEST_F(OffsetFieldTest, LeapQueriesDelegate) {
    auto shifted = *OffsetDateTimeField::create(fields.year, 1);
    EXPECT_TRUE(*shifted->is_leap(instant_of(2000, 6, 1)));
    EXPECT_FALSE(*shifted->is_leap(instant_of(1900, 6, 1)));
    EXPECT_EQ(*shifted->leap_amount(instant_of(2004, 6, 1)), 1);
    EXPECT_EQ(shifted->leap_duration_field(), days_duration());
}

TEST_F(OffsetFieldTest, RejectsInvalidArguments) {
    auto zero = OffsetDateTimeField::create(hour, 0);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, FieldErrorCode::invalid_argument);

    EXPECT_FALSE(OffsetDateTimeField::create(nullptr, 1).has_value());

    auto unsupported = UnsupportedDateTimeField::instance(FieldKind::hour_of_day, hours_duration());
    ASSERT_TRUE(unsupported.has_value());
    EXPECT_FALSE(OffsetDateTimeField::create(*unsupported, 1).has_value());
}
