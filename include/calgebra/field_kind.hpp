#pragma once

#include <optional>
#include <string_view>

#include <cstdint>

namespace calgebra {

/**
 * @brief Unit of elapsed time measured by a DurationField
 *
 * Ordered from the largest nominal unit to the smallest.
 */
enum class DurationKind : uint8_t {
    eras,
    centuries,
    weekyears,
    years,
    months,
    weeks,
    days,
    halfdays,
    hours,
    minutes,
    seconds,
    millis
};

/**
 * @brief Calendar component represented by a DateTimeField
 *
 * Each kind has a fixed unit duration (the step taken by add()) and an
 * optional range duration (the span over which the value cycles).
 */
enum class FieldKind : uint8_t {
    era,
    year_of_era,
    century_of_era,
    year_of_century,
    year,
    day_of_year,
    month_of_year,
    day_of_month,
    weekyear_of_century,
    weekyear,
    week_of_weekyear,
    day_of_week,
    halfday_of_day,
    hour_of_halfday,
    clockhour_of_halfday,
    clockhour_of_day,
    hour_of_day,
    minute_of_day,
    minute_of_hour,
    second_of_day,
    second_of_minute,
    millis_of_day,
    millis_of_second
};

[[nodiscard]] constexpr std::string_view duration_kind_name(DurationKind kind) noexcept {
    switch (kind) {
        case DurationKind::eras:
            return "eras";
        case DurationKind::centuries:
            return "centuries";
        case DurationKind::weekyears:
            return "weekyears";
        case DurationKind::years:
            return "years";
        case DurationKind::months:
            return "months";
        case DurationKind::weeks:
            return "weeks";
        case DurationKind::days:
            return "days";
        case DurationKind::halfdays:
            return "halfdays";
        case DurationKind::hours:
            return "hours";
        case DurationKind::minutes:
            return "minutes";
        case DurationKind::seconds:
            return "seconds";
        case DurationKind::millis:
            return "millis";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view field_kind_name(FieldKind kind) noexcept {
    switch (kind) {
        case FieldKind::era:
            return "era";
        case FieldKind::year_of_era:
            return "yearOfEra";
        case FieldKind::century_of_era:
            return "centuryOfEra";
        case FieldKind::year_of_century:
            return "yearOfCentury";
        case FieldKind::year:
            return "year";
        case FieldKind::day_of_year:
            return "dayOfYear";
        case FieldKind::month_of_year:
            return "monthOfYear";
        case FieldKind::day_of_month:
            return "dayOfMonth";
        case FieldKind::weekyear_of_century:
            return "weekyearOfCentury";
        case FieldKind::weekyear:
            return "weekyear";
        case FieldKind::week_of_weekyear:
            return "weekOfWeekyear";
        case FieldKind::day_of_week:
            return "dayOfWeek";
        case FieldKind::halfday_of_day:
            return "halfdayOfDay";
        case FieldKind::hour_of_halfday:
            return "hourOfHalfday";
        case FieldKind::clockhour_of_halfday:
            return "clockhourOfHalfday";
        case FieldKind::clockhour_of_day:
            return "clockhourOfDay";
        case FieldKind::hour_of_day:
            return "hourOfDay";
        case FieldKind::minute_of_day:
            return "minuteOfDay";
        case FieldKind::minute_of_hour:
            return "minuteOfHour";
        case FieldKind::second_of_day:
            return "secondOfDay";
        case FieldKind::second_of_minute:
            return "secondOfMinute";
        case FieldKind::millis_of_day:
            return "millisOfDay";
        case FieldKind::millis_of_second:
            return "millisOfSecond";
    }
    return "unknown";
}

/// Unit duration of a field kind (what one step of add() moves)
[[nodiscard]] constexpr DurationKind unit_kind(FieldKind kind) noexcept {
    switch (kind) {
        case FieldKind::era:
            return DurationKind::eras;
        case FieldKind::century_of_era:
            return DurationKind::centuries;
        case FieldKind::year_of_era:
        case FieldKind::year_of_century:
        case FieldKind::year:
            return DurationKind::years;
        case FieldKind::month_of_year:
            return DurationKind::months;
        case FieldKind::weekyear_of_century:
        case FieldKind::weekyear:
            return DurationKind::weekyears;
        case FieldKind::week_of_weekyear:
            return DurationKind::weeks;
        case FieldKind::day_of_year:
        case FieldKind::day_of_month:
        case FieldKind::day_of_week:
            return DurationKind::days;
        case FieldKind::halfday_of_day:
            return DurationKind::halfdays;
        case FieldKind::hour_of_halfday:
        case FieldKind::clockhour_of_halfday:
        case FieldKind::clockhour_of_day:
        case FieldKind::hour_of_day:
            return DurationKind::hours;
        case FieldKind::minute_of_day:
        case FieldKind::minute_of_hour:
            return DurationKind::minutes;
        case FieldKind::second_of_day:
        case FieldKind::second_of_minute:
            return DurationKind::seconds;
        case FieldKind::millis_of_day:
        case FieldKind::millis_of_second:
            return DurationKind::millis;
    }
    return DurationKind::millis;
}

/// Range duration of a field kind, or nullopt for unbounded fields (era, year, weekyear)
[[nodiscard]] constexpr std::optional<DurationKind> range_kind(FieldKind kind) noexcept {
    switch (kind) {
        case FieldKind::era:
        case FieldKind::year:
        case FieldKind::weekyear:
            return std::nullopt;
        case FieldKind::year_of_era:
        case FieldKind::century_of_era:
            return DurationKind::eras;
        case FieldKind::year_of_century:
        case FieldKind::weekyear_of_century:
            return DurationKind::centuries;
        case FieldKind::day_of_year:
        case FieldKind::month_of_year:
            return DurationKind::years;
        case FieldKind::day_of_month:
            return DurationKind::months;
        case FieldKind::week_of_weekyear:
            return DurationKind::weekyears;
        case FieldKind::day_of_week:
            return DurationKind::weeks;
        case FieldKind::halfday_of_day:
        case FieldKind::clockhour_of_day:
        case FieldKind::hour_of_day:
        case FieldKind::minute_of_day:
        case FieldKind::second_of_day:
        case FieldKind::millis_of_day:
            return DurationKind::days;
        case FieldKind::hour_of_halfday:
        case FieldKind::clockhour_of_halfday:
            return DurationKind::halfdays;
        case FieldKind::minute_of_hour:
            return DurationKind::hours;
        case FieldKind::second_of_minute:
            return DurationKind::minutes;
        case FieldKind::millis_of_second:
            return DurationKind::seconds;
    }
    return std::nullopt;
}

} // namespace calgebra
