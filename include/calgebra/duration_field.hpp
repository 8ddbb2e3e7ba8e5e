#pragma once

#include "calgebra/field_error.hpp"
#include "calgebra/field_kind.hpp"
#include "calgebra/safe_math.hpp"

#include <compare>
#include <string_view>

#include <cstdint>

namespace calgebra {

/**
 * @brief A unit of elapsed time, possibly imprecise ("a month")
 *
 * Converts between a millisecond duration and an integer count of units,
 * optionally relative to a reference instant, and moves instants along the
 * millisecond axis by a number of units.
 *
 * ## Precision
 * A precise field has a fixed unit_millis() and every operation is a plain
 * (overflow-checked) multiplication or division. An imprecise field only knows
 * its average unit length; the instant-relative operations (value_at,
 * millis_at, add, difference) are answered by the calendar field that owns it.
 *
 * ## Default operations
 * The non-instant conversions are defined in terms of unit_millis() and the
 * required operations. Implementations override them only when they can do
 * better (MillisDurationField) or must refuse (UnsupportedDurationField).
 *
 * Instances are immutable and shared by std::shared_ptr<const DurationField>.
 */
class DurationField {
public:
    virtual ~DurationField() = default;

    DurationField() = default;
    DurationField(const DurationField&) = delete;
    DurationField& operator=(const DurationField&) = delete;

    [[nodiscard]] virtual DurationKind type() const noexcept = 0;

    [[nodiscard]] std::string_view name() const noexcept { return duration_kind_name(type()); }

    /// False only for UnsupportedDurationField
    [[nodiscard]] virtual bool is_supported() const noexcept { return true; }

    /// True if every unit has exactly unit_millis() milliseconds
    [[nodiscard]] virtual bool is_precise() const noexcept = 0;

    /// Exact unit length for precise fields, average length otherwise
    [[nodiscard]] virtual int64_t unit_millis() const noexcept = 0;

    /// Number of whole units in a duration (truncated toward zero)
    [[nodiscard]] virtual FieldResult<int32_t> value(int64_t duration) const {
        return value_as_long(duration).and_then(safe_to_int);
    }

    [[nodiscard]] virtual FieldResult<int64_t> value_as_long(int64_t duration) const {
        return duration / unit_millis();
    }

    /// Number of whole units in a duration that starts at instant
    [[nodiscard]] virtual FieldResult<int32_t> value_at(int64_t duration, int64_t instant) const {
        return value_as_long_at(duration, instant).and_then(safe_to_int);
    }

    [[nodiscard]] virtual FieldResult<int64_t> value_as_long_at(int64_t duration,
                                                                int64_t instant) const = 0;

    /// Milliseconds spanned by value units (inverse of value())
    [[nodiscard]] virtual FieldResult<int64_t> millis(int64_t value) const {
        return safe_multiply(value, unit_millis());
    }

    /// Milliseconds spanned by value units starting at instant
    [[nodiscard]] virtual FieldResult<int64_t> millis_at(int64_t value, int64_t instant) const = 0;

    /// Move instant forward (or backward) by value units
    [[nodiscard]] virtual FieldResult<int64_t> add(int64_t instant, int64_t value) const = 0;

    /**
     * Number of whole units between two instants
     *
     * Sign-consistent with add(): difference(add(b, n), b) == n for every
     * representable n.
     */
    [[nodiscard]] virtual FieldResult<int32_t> difference(int64_t minuend_instant,
                                                          int64_t subtrahend_instant) const {
        return difference_as_long(minuend_instant, subtrahend_instant).and_then(safe_to_int);
    }

    [[nodiscard]] virtual FieldResult<int64_t>
    difference_as_long(int64_t minuend_instant, int64_t subtrahend_instant) const = 0;

    /// Order by nominal unit length only (precision is ignored)
    [[nodiscard]] virtual std::strong_ordering compare(const DurationField& other) const noexcept {
        return unit_millis() <=> other.unit_millis();
    }
};

} // namespace calgebra
