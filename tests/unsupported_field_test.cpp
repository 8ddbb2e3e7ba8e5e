#include <thread>
#include <vector>

#include "support/gregorian_test_fields.hpp"

#include <gtest/gtest.h>

using namespace calgebra;
using namespace calgebra::test;

// ==============================================================================
// Sentinel caching
// ==============================================================================

TEST(UnsupportedFieldTest, DurationSentinelIsCached) {
    auto first = UnsupportedDurationField::instance(DurationKind::weeks);
    auto second = UnsupportedDurationField::instance(DurationKind::weeks);
    EXPECT_EQ(first, second);
    EXPECT_NE(first, UnsupportedDurationField::instance(DurationKind::eras));
}

TEST(UnsupportedFieldTest, FieldSentinelIsCachedPerDuration) {
    auto weeks = UnsupportedDurationField::instance(DurationKind::weeks);
    auto first = UnsupportedDateTimeField::instance(FieldKind::week_of_weekyear, weeks);
    auto second = UnsupportedDateTimeField::instance(FieldKind::week_of_weekyear, weeks);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);

    auto other = UnsupportedDateTimeField::instance(FieldKind::week_of_weekyear, days_duration());
    ASSERT_TRUE(other.has_value());
    EXPECT_NE(*first, *other);
}

TEST(UnsupportedFieldTest, ConcurrentLookupsAgree) {
    constexpr int thread_count = 8;
    std::vector<UnsupportedDateTimeField::FieldPtr> seen(thread_count);
    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&seen, i] {
            auto field = UnsupportedDateTimeField::instance(
                FieldKind::weekyear_of_century,
                UnsupportedDurationField::instance(DurationKind::centuries));
            if (field) {
                seen[i] = *field;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    ASSERT_NE(seen[0], nullptr);
    for (const auto& field : seen) {
        EXPECT_EQ(field, seen[0]);
    }
}

TEST(UnsupportedFieldTest, RejectsNullDuration) {
    auto result = UnsupportedDateTimeField::instance(FieldKind::week_of_weekyear, nullptr);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, FieldErrorCode::invalid_argument);
}

// ==============================================================================
// Behavior
// ==============================================================================

TEST(UnsupportedFieldTest, Metadata) {
    auto field = *UnsupportedDateTimeField::instance(
        FieldKind::week_of_weekyear, UnsupportedDurationField::instance(DurationKind::weeks));
    EXPECT_EQ(field->type(), FieldKind::week_of_weekyear);
    EXPECT_EQ(field->name(), "weekOfWeekyear");
    EXPECT_FALSE(field->is_supported());
    EXPECT_FALSE(field->is_lenient());
    EXPECT_EQ(field->range_duration_field(), nullptr);
    EXPECT_EQ(field->leap_duration_field(), nullptr);
    EXPECT_EQ(field->duration_field()->type(), DurationKind::weeks);
}

TEST(UnsupportedFieldTest, OperationsFail) {
    auto field = *UnsupportedDateTimeField::instance(
        FieldKind::week_of_weekyear, UnsupportedDurationField::instance(DurationKind::weeks));

    auto value = field->get(0);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().code, FieldErrorCode::unsupported_operation);
    EXPECT_EQ(value.error().field, FieldKind::week_of_weekyear);
    EXPECT_EQ(value.error().describe(),
              "Unsupported operation [weekOfWeekyear]: weekOfWeekyear field is unsupported");

    EXPECT_FALSE(field->set(0, 1).has_value());
    EXPECT_FALSE(field->add_wrap_field(0, 1).has_value());
    EXPECT_FALSE(field->is_leap(0).has_value());
    EXPECT_FALSE(field->leap_amount(0).has_value());
    EXPECT_FALSE(field->min_value().has_value());
    EXPECT_FALSE(field->max_value_at(0).has_value());
    EXPECT_FALSE(field->round_floor(0).has_value());
    EXPECT_FALSE(field->round_half_even(0).has_value());
    EXPECT_FALSE(field->remainder(0).has_value());

    // Unsupported duration: add fails too
    auto added = field->add(0, 1);
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().duration, DurationKind::weeks);
}

TEST(UnsupportedFieldTest, AddWorksThroughSupportedDuration) {
    auto weeks = *ScaledDurationField::create(days_duration(), DurationKind::weeks, 7);
    auto field = *UnsupportedDateTimeField::instance(FieldKind::week_of_weekyear, weeks);

    int64_t instant = instant_of(2001, 1, 1);
    EXPECT_EQ(*field->add(instant, 3), instant_of(2001, 1, 22));
    EXPECT_EQ(*field->difference(instant_of(2001, 1, 22), instant), 3);
    EXPECT_EQ(*field->difference_as_long(instant, instant_of(2001, 1, 22)), -3);
    EXPECT_FALSE(field->get(instant).has_value());
}
