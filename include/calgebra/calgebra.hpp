#pragma once

/**
 * @file calgebra.hpp
 * @brief Calendar and duration field algebra
 *
 * This header aggregates the field contracts and every primitive and
 * decorator field.
 *
 * Contracts:
 * - DurationField - a unit of elapsed time
 * - DateTimeField - a calendar component, with rounding and partial carry
 * - Partial - ordered field values without a full instant
 *
 * Duration fields:
 * - MillisDurationField, PreciseDurationField, ScaledDurationField
 * - UnsupportedDurationField
 *
 * Date-time fields:
 * - PreciseDurationDateTimeField, ImpreciseDateTimeField (bases for calendar fields)
 * - PreciseDateTimeField
 * - DividedDateTimeField, RemainderDateTimeField
 * - OffsetDateTimeField, SkipDateTimeField, SkipUndoDateTimeField
 * - ZeroIsMaxDateTimeField
 * - LenientDateTimeField, StrictDateTimeField (with LenientContext)
 * - UnsupportedDateTimeField
 *
 * Every fallible operation returns FieldResult<T>; see field_error.hpp.
 */

#include "date_time_field.hpp"
#include "duration_field.hpp"
#include "field_error.hpp"
#include "field_kind.hpp"
#include "safe_math.hpp"

#include "fields/divided_date_time_field.hpp"
#include "fields/imprecise_date_time_field.hpp"
#include "fields/leniency_date_time_fields.hpp"
#include "fields/millis_duration_field.hpp"
#include "fields/offset_date_time_field.hpp"
#include "fields/precise_date_time_field.hpp"
#include "fields/precise_duration_date_time_field.hpp"
#include "fields/precise_duration_field.hpp"
#include "fields/remainder_date_time_field.hpp"
#include "fields/scaled_duration_field.hpp"
#include "fields/skip_date_time_field.hpp"
#include "fields/skip_undo_date_time_field.hpp"
#include "fields/unsupported_date_time_field.hpp"
#include "fields/unsupported_duration_field.hpp"
#include "fields/zero_is_max_date_time_field.hpp"
