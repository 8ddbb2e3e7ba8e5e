#include "support/gregorian_test_fields.hpp"

#include <gtest/gtest.h>

using namespace calgebra;
using namespace calgebra::test;

// Test fixture building clock-hour fields from hour-of-day
class ZeroIsMaxFieldTest : public ::testing::Test {
protected:
    void SetUp() override {
        hour = *PreciseDateTimeField::create(FieldKind::hour_of_day, hours_duration(),
                                             days_duration());
        auto clock = ZeroIsMaxDateTimeField::create(hour, FieldKind::clockhour_of_day);
        ASSERT_TRUE(clock.has_value()) << clock.error().describe();
        clockhour = *clock;
    }

    std::shared_ptr<const PreciseDateTimeField> hour;
    ZeroIsMaxDateTimeField::FieldPtr clockhour;
};

TEST_F(ZeroIsMaxFieldTest, Bounds) {
    EXPECT_EQ(clockhour->type(), FieldKind::clockhour_of_day);
    EXPECT_EQ(clockhour->name(), "clockhourOfDay");
    EXPECT_EQ(*clockhour->min_value(), 1);
    EXPECT_EQ(*clockhour->max_value(), 24);
    EXPECT_EQ(*clockhour->min_value_at(12345), 1);
    EXPECT_EQ(*clockhour->max_value_at(12345), 24);
    EXPECT_EQ(clockhour->duration_field(), hours_duration());
    EXPECT_EQ(clockhour->range_duration_field(), days_duration());
}

TEST_F(ZeroIsMaxFieldTest, MidnightIsMax) {
    EXPECT_EQ(*clockhour->get(0), 24);
    EXPECT_EQ(*clockhour->get(millis_per_day + 59 * millis_per_minute), 24);
    EXPECT_EQ(*clockhour->get(millis_per_hour), 1);
    EXPECT_EQ(*clockhour->get(23 * millis_per_hour), 23);
}

TEST_F(ZeroIsMaxFieldTest, SetStoresMaxAsZero) {
    int64_t instant = 15 * millis_per_hour + 1234;
    auto midnight = clockhour->set(instant, 24);
    ASSERT_TRUE(midnight.has_value());
    EXPECT_EQ(*midnight, 1234);
    EXPECT_EQ(*hour->get(*midnight), 0);
    EXPECT_EQ(*clockhour->set(instant, 1), millis_per_hour + 1234);
}

TEST_F(ZeroIsMaxFieldTest, SetRejectsZero) {
    auto result = clockhour->set(0, 0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FieldErrorCode::invalid_field_value);
    EXPECT_EQ(result.error().field, FieldKind::clockhour_of_day);
    EXPECT_EQ(result.error().lower_bound, 1);
    EXPECT_EQ(result.error().upper_bound, 24);
    EXPECT_FALSE(clockhour->set(0, 25).has_value());
}

TEST_F(ZeroIsMaxFieldTest, ArithmeticUsesWrappedField) {
    int64_t late = 23 * millis_per_hour;
    auto wrapped = clockhour->add_wrap_field(late, 1);
    ASSERT_TRUE(wrapped.has_value());
    EXPECT_EQ(*wrapped, 0);
    EXPECT_EQ(*clockhour->get(*wrapped), 24);

    EXPECT_EQ(*clockhour->add(late, 1), millis_per_day);
    EXPECT_EQ(*clockhour->difference(millis_per_day, late), 1);
    EXPECT_EQ(*clockhour->round_floor(late + 1), late);
    EXPECT_EQ(*clockhour->round_ceiling(late + 1), millis_per_day);
}

TEST_F(ZeroIsMaxFieldTest, ClockhourOfHalfday) {
    auto hour_of_halfday = RemainderDateTimeField::create(hour, FieldKind::hour_of_halfday, 12);
    ASSERT_TRUE(hour_of_halfday.has_value());
    auto clock = ZeroIsMaxDateTimeField::create(*hour_of_halfday, FieldKind::clockhour_of_halfday);
    ASSERT_TRUE(clock.has_value());

    EXPECT_EQ(*(*clock)->max_value(), 12);
    EXPECT_EQ(*(*clock)->get(12 * millis_per_hour), 12);
    EXPECT_EQ(*(*clock)->get(13 * millis_per_hour), 1);
    EXPECT_EQ(*(*clock)->set(13 * millis_per_hour, 12), 12 * millis_per_hour);
}

TEST_F(ZeroIsMaxFieldTest, PartialValuesStayInClockRange) {
    auto partial = Partial::create({clockhour}, {23});
    ASSERT_TRUE(partial.has_value()) << partial.error().describe();

    auto midnight = partial->with_field_wrapped(FieldKind::clockhour_of_day, 1);
    ASSERT_TRUE(midnight.has_value()) << midnight.error().describe();
    EXPECT_EQ(midnight->value(0), 24);

    auto one = midnight->with_field_wrapped(FieldKind::clockhour_of_day, 1);
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(one->value(0), 1);
    EXPECT_EQ(one->with_field_wrapped(FieldKind::clockhour_of_day, -1)->value(0), 24);

    auto added = partial->with_field_added(FieldKind::clockhour_of_day, 1);
    ASSERT_TRUE(added.has_value());
    EXPECT_EQ(added->value(0), 24);

    auto zero = partial->with_field(FieldKind::clockhour_of_day, 0);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, FieldErrorCode::invalid_field_value);
}

TEST_F(ZeroIsMaxFieldTest, RequiresZeroMinimum) {
    auto fields = GregorianFields::make();
    auto result = ZeroIsMaxDateTimeField::create(fields.year, FieldKind::year);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FieldErrorCode::invalid_argument);

    EXPECT_FALSE(ZeroIsMaxDateTimeField::create(nullptr, FieldKind::clockhour_of_day).has_value());
}
