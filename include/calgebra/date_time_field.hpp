#pragma once

#include "calgebra/duration_field.hpp"
#include "calgebra/field_error.hpp"
#include "calgebra/field_kind.hpp"
#include "calgebra/safe_math.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace calgebra {

class Partial;

/**
 * @brief A calendar component ("month of year") on the millisecond axis
 *
 * A DateTimeField reads and writes one component of an absolute instant or
 * of a Partial (an ordered array of field values). Every operation is a pure
 * function of its arguments; fields hold no mutable state and are shared as
 * std::shared_ptr<const DateTimeField> once a calendar system is assembled.
 *
 * ## Required operations
 * Implementations supply type(), is_lenient(), get(), set(), min_value(),
 * max_value(), round_floor(), duration_field() and range_duration_field().
 *
 * ## Default operations
 * Everything else has a default defined in terms of the required set:
 * - add()/difference() delegate to duration_field()
 * - add_wrap_field() wraps get() within [min, max] and calls set()
 * - the rounding family derives from round_floor()
 * - the partial operations implement carry propagation between the
 *   fields of a Partial (see add_partial())
 * - the instant- and partial-dependent bounds fall back to the intrinsic ones
 *
 * Decorators implement this interface directly and forward to the field they
 * wrap; they never derive from one another.
 */
class DateTimeField {
public:
    virtual ~DateTimeField() = default;

    DateTimeField() = default;
    DateTimeField(const DateTimeField&) = delete;
    DateTimeField& operator=(const DateTimeField&) = delete;

    // === Metadata ===

    [[nodiscard]] virtual FieldKind type() const noexcept = 0;

    [[nodiscard]] std::string_view name() const noexcept { return field_kind_name(type()); }

    /// False only for UnsupportedDateTimeField
    [[nodiscard]] virtual bool is_supported() const noexcept { return true; }

    /// True if set() accepts out-of-range values by rolling over into larger fields
    [[nodiscard]] virtual bool is_lenient() const noexcept = 0;

    // === Instant access ===

    [[nodiscard]] virtual FieldResult<int32_t> get(int64_t instant) const = 0;

    /**
     * Set this field's value, leaving the other fields as unchanged as possible
     *
     * @return The updated instant, or invalid_field_value if value lies outside
     *         [min_value_at(instant), max_value_at(instant)]
     */
    [[nodiscard]] virtual FieldResult<int64_t> set(int64_t instant, int32_t value) const = 0;

    /// Add amount units; larger fields overflow naturally on the millisecond axis
    [[nodiscard]] virtual FieldResult<int64_t> add(int64_t instant, int64_t amount) const {
        return duration_field()->add(instant, amount);
    }

    /// Add amount units, wrapping within this field only (larger fields untouched)
    [[nodiscard]] virtual FieldResult<int64_t> add_wrap_field(int64_t instant,
                                                              int32_t amount) const;

    [[nodiscard]] virtual FieldResult<int32_t> difference(int64_t minuend_instant,
                                                          int64_t subtrahend_instant) const {
        return duration_field()->difference(minuend_instant, subtrahend_instant);
    }

    [[nodiscard]] virtual FieldResult<int64_t>
    difference_as_long(int64_t minuend_instant, int64_t subtrahend_instant) const {
        return duration_field()->difference_as_long(minuend_instant, subtrahend_instant);
    }

    // === Partial access ===

    /**
     * Add to the value at index, carrying overflow into larger fields
     *
     * Bounded policy: while the amount does not fit in [min, max], the slack
     * up to the bound is consumed, one unit is added to the field at index - 1
     * (recursively, so carries cascade) and this slot restarts from its new
     * min (or max when subtracting). Carrying past index 0, or into a field
     * whose unit does not match this field's range, fails with
     * incompatible_fields_for_carry. Smaller fields are re-clamped at the end.
     *
     * @param partial Field sequence giving each slot meaning
     * @param index Slot of this field within partial
     * @param values Caller-owned values, updated in place
     * @param amount Units to add (may be negative)
     */
    [[nodiscard]] virtual FieldResult<void> add_partial(const Partial& partial, size_t index,
                                                        std::span<int32_t> values,
                                                        int32_t amount) const {
        return carry_partial(partial, index, values, amount, false);
    }

    /// As add_partial(), but overflow of the outermost field wraps in place
    [[nodiscard]] virtual FieldResult<void> add_wrap_partial(const Partial& partial, size_t index,
                                                             std::span<int32_t> values,
                                                             int32_t amount) const {
        return carry_partial(partial, index, values, amount, true);
    }

    /// Add amount to a single slot, wrapping within its bounds, then re-clamp smaller fields
    [[nodiscard]] virtual FieldResult<void> add_wrap_field_partial(const Partial& partial,
                                                                   size_t index,
                                                                   std::span<int32_t> values,
                                                                   int32_t amount) const;

    /**
     * Set the value at index and clamp every smaller field into its new range
     *
     * Later slots only move toward the nearer bound; a day-of-month of 31
     * becomes 28 when the month is set to February and stays 28 afterwards.
     */
    [[nodiscard]] virtual FieldResult<void> set_partial(const Partial& partial, size_t index,
                                                        std::span<int32_t> values,
                                                        int32_t value) const;

    // === Duration fields ===

    /// Unit of this field; never null (unsupported units use a sentinel)
    [[nodiscard]] virtual std::shared_ptr<const DurationField> duration_field() const = 0;

    /// Span over which this field cycles, or null for unbounded fields such as year
    [[nodiscard]] virtual std::shared_ptr<const DurationField> range_duration_field() const = 0;

    // === Leap support ===

    [[nodiscard]] virtual FieldResult<bool> is_leap(int64_t /*instant*/) const { return false; }

    [[nodiscard]] virtual FieldResult<int32_t> leap_amount(int64_t /*instant*/) const {
        return 0;
    }

    [[nodiscard]] virtual std::shared_ptr<const DurationField> leap_duration_field() const {
        return nullptr;
    }

    // === Bounds ===

    [[nodiscard]] virtual FieldResult<int32_t> min_value() const = 0;

    [[nodiscard]] virtual FieldResult<int32_t> min_value_at(int64_t /*instant*/) const {
        return min_value();
    }

    [[nodiscard]] virtual FieldResult<int32_t> min_value_in(const Partial& /*partial*/) const {
        return min_value();
    }

    [[nodiscard]] virtual FieldResult<int32_t>
    min_value_for(const Partial& partial, std::span<const int32_t> /*values*/) const {
        return min_value_in(partial);
    }

    [[nodiscard]] virtual FieldResult<int32_t> max_value() const = 0;

    [[nodiscard]] virtual FieldResult<int32_t> max_value_at(int64_t /*instant*/) const {
        return max_value();
    }

    [[nodiscard]] virtual FieldResult<int32_t> max_value_in(const Partial& /*partial*/) const {
        return max_value();
    }

    [[nodiscard]] virtual FieldResult<int32_t>
    max_value_for(const Partial& partial, std::span<const int32_t> /*values*/) const {
        return max_value_in(partial);
    }

    // === Rounding ===

    /// Largest instant <= instant at which this field's value starts
    [[nodiscard]] virtual FieldResult<int64_t> round_floor(int64_t instant) const = 0;

    /// Smallest instant >= instant at which this field's value starts
    [[nodiscard]] virtual FieldResult<int64_t> round_ceiling(int64_t instant) const;

    /// Nearer of floor/ceiling, ties to floor
    [[nodiscard]] virtual FieldResult<int64_t> round_half_floor(int64_t instant) const;

    /// Nearer of floor/ceiling, ties to ceiling
    [[nodiscard]] virtual FieldResult<int64_t> round_half_ceiling(int64_t instant) const;

    /// Nearer of floor/ceiling, ties to whichever gives an even value
    [[nodiscard]] virtual FieldResult<int64_t> round_half_even(int64_t instant) const;

    /// instant - round_floor(instant)
    [[nodiscard]] virtual FieldResult<int64_t> remainder(int64_t instant) const;

private:
    FieldResult<void> carry_partial(const Partial& partial, size_t index,
                                    std::span<int32_t> values, int32_t amount,
                                    bool wrap_outermost) const;

    FieldResult<const DateTimeField*> carry_target(const Partial& partial, size_t index) const;
};

/**
 * @brief An ordered set of calendar field values without a full instant
 *
 * A Partial pairs a sequence of fields, largest duration first ("year,
 * monthOfYear, dayOfMonth"), with one value per field. Each value satisfies
 * its field's bounds given the values that precede it.
 *
 * Partial is an immutable value type. The with_field* operations return a new
 * Partial computed by the field's partial operations; the original is never
 * modified.
 *
 * Example:
 * @code
 *   auto date = Partial::create({year, month, day}, {2001, 12, 31});
 *   auto next = date->with_field_added(FieldKind::month_of_year, 1);
 *   // next->values() == {2002, 1, 31}
 * @endcode
 */
class Partial {
public:
    using FieldPtr = std::shared_ptr<const DateTimeField>;

    /**
     * @brief Validate and build a partial
     *
     * Checks that the sizes match, every field is supported, fields are
     * ordered largest first without duplicates, and every value lies within
     * its field's bounds given the preceding values.
     */
    [[nodiscard]] static FieldResult<Partial> create(std::vector<FieldPtr> fields,
                                                     std::vector<int32_t> values);

    [[nodiscard]] size_t size() const noexcept { return fields_.size(); }

    [[nodiscard]] const FieldPtr& field(size_t index) const noexcept { return fields_[index]; }

    [[nodiscard]] FieldKind field_kind(size_t index) const noexcept {
        return fields_[index]->type();
    }

    [[nodiscard]] int32_t value(size_t index) const noexcept { return values_[index]; }

    [[nodiscard]] std::span<const int32_t> values() const noexcept { return values_; }

    [[nodiscard]] std::optional<size_t> index_of(FieldKind kind) const noexcept {
        for (size_t i = 0; i < fields_.size(); ++i) {
            if (fields_[i]->type() == kind) {
                return i;
            }
        }
        return std::nullopt;
    }

    /// Value of the given field, or unsupported_operation if it is not part of this partial
    [[nodiscard]] FieldResult<int32_t> get(FieldKind kind) const {
        auto index = index_of(kind);
        if (!index) {
            return make_unsupported_error(kind);
        }
        return values_[*index];
    }

    /// Copy with kind set to value; smaller fields are clamped into range
    [[nodiscard]] FieldResult<Partial> with_field(FieldKind kind, int32_t value) const {
        return apply(kind, [&](const DateTimeField& field, size_t index, std::span<int32_t> values) {
            return field.set_partial(*this, index, values, value);
        });
    }

    /// Copy with amount added to kind, carrying into larger fields (bounded)
    [[nodiscard]] FieldResult<Partial> with_field_added(FieldKind kind, int32_t amount) const {
        return apply(kind, [&](const DateTimeField& field, size_t index, std::span<int32_t> values) {
            return field.add_partial(*this, index, values, amount);
        });
    }

    /// Copy with amount added to kind, carrying into larger fields and wrapping at the outermost
    [[nodiscard]] FieldResult<Partial> with_field_add_wrapped(FieldKind kind,
                                                              int32_t amount) const {
        return apply(kind, [&](const DateTimeField& field, size_t index, std::span<int32_t> values) {
            return field.add_wrap_partial(*this, index, values, amount);
        });
    }

    /// Copy with amount added to kind, wrapping within that field only
    [[nodiscard]] FieldResult<Partial> with_field_wrapped(FieldKind kind, int32_t amount) const {
        return apply(kind, [&](const DateTimeField& field, size_t index, std::span<int32_t> values) {
            return field.add_wrap_field_partial(*this, index, values, amount);
        });
    }

private:
    Partial(std::vector<FieldPtr> fields, std::vector<int32_t> values) noexcept
        : fields_(std::move(fields)),
          values_(std::move(values)) {}

    template <typename Op>
    FieldResult<Partial> apply(FieldKind kind, Op&& op) const {
        auto index = index_of(kind);
        if (!index) {
            return make_unsupported_error(kind);
        }
        std::vector<int32_t> updated = values_;
        auto result = op(*fields_[*index], *index, std::span<int32_t>(updated));
        if (!result) {
            return unexpected(result.error());
        }
        return Partial(fields_, std::move(updated));
    }

    static FieldResult<void> check_order(const DateTimeField& larger,
                                         const DateTimeField& smaller);

    std::vector<FieldPtr> fields_;
    std::vector<int32_t> values_;
};

// =============================================================================
// DateTimeField default operations
// =============================================================================

inline FieldResult<int64_t> DateTimeField::add_wrap_field(int64_t instant, int32_t amount) const {
    auto current = get(instant);
    if (!current) {
        return unexpected(current.error());
    }
    auto min = min_value_at(instant);
    if (!min) {
        return unexpected(min.error());
    }
    auto max = max_value_at(instant);
    if (!max) {
        return unexpected(max.error());
    }
    auto wrapped = get_wrapped_value(*current, amount, *min, *max);
    if (!wrapped) {
        return unexpected(wrapped.error());
    }
    return set(instant, *wrapped);
}

inline FieldResult<void> DateTimeField::add_wrap_field_partial(const Partial& partial,
                                                               size_t index,
                                                               std::span<int32_t> values,
                                                               int32_t amount) const {
    if (index >= values.size()) {
        return make_argument_error("Field index out of range");
    }
    auto min = min_value_in(partial);
    if (!min) {
        return unexpected(min.error());
    }
    auto max = max_value_in(partial);
    if (!max) {
        return unexpected(max.error());
    }
    auto wrapped = get_wrapped_value(values[index], amount, *min, *max);
    if (!wrapped) {
        return unexpected(wrapped.error());
    }
    return set_partial(partial, index, values, *wrapped);
}

inline FieldResult<void> DateTimeField::set_partial(const Partial& partial, size_t index,
                                                    std::span<int32_t> values,
                                                    int32_t value) const {
    if (index >= values.size() || values.size() != partial.size()) {
        return make_argument_error("Field index out of range");
    }
    auto min = min_value_for(partial, values);
    if (!min) {
        return unexpected(min.error());
    }
    auto max = max_value_for(partial, values);
    if (!max) {
        return unexpected(max.error());
    }
    if (auto valid = verify_value_bounds(type(), value, *min, *max); !valid) {
        return valid;
    }
    values[index] = value;

    for (size_t i = index + 1; i < partial.size(); ++i) {
        const DateTimeField& smaller = *partial.field(i);
        auto smaller_max = smaller.max_value_for(partial, values);
        if (!smaller_max) {
            return unexpected(smaller_max.error());
        }
        if (values[i] > *smaller_max) {
            values[i] = *smaller_max;
        }
        auto smaller_min = smaller.min_value_for(partial, values);
        if (!smaller_min) {
            return unexpected(smaller_min.error());
        }
        if (values[i] < *smaller_min) {
            values[i] = *smaller_min;
        }
    }
    return {};
}

inline FieldResult<const DateTimeField*> DateTimeField::carry_target(const Partial& partial,
                                                                     size_t index) const {
    const DateTimeField& larger = *partial.field(index - 1);
    auto range = range_duration_field();
    auto larger_unit = larger.duration_field();
    if (!range || !larger_unit || range->type() != larger_unit->type()) {
        return make_carry_error(type(), "Fields invalid for add");
    }
    return &larger;
}

inline FieldResult<void> DateTimeField::carry_partial(const Partial& partial, size_t index,
                                                      std::span<int32_t> values, int32_t amount,
                                                      bool wrap_outermost) const {
    if (index >= values.size() || values.size() != partial.size()) {
        return make_argument_error("Field index out of range");
    }
    if (amount == 0) {
        return {};
    }

    // Resolved lazily: carry compatibility is only checked when a carry happens
    const DateTimeField* larger = nullptr;
    int64_t remaining = amount;

    while (remaining > 0) {
        auto max = max_value_for(partial, values);
        if (!max) {
            return unexpected(max.error());
        }
        int64_t proposed = static_cast<int64_t>(values[index]) + remaining;
        if (proposed <= *max) {
            values[index] = static_cast<int32_t>(proposed);
            break;
        }
        if (larger == nullptr) {
            if (index == 0) {
                if (!wrap_outermost) {
                    return make_carry_error(type(), "Maximum value exceeded for add");
                }
                remaining -= (static_cast<int64_t>(*max) + 1) - values[index];
                auto min = min_value_for(partial, values);
                if (!min) {
                    return unexpected(min.error());
                }
                values[index] = *min;
                continue;
            }
            auto target = carry_target(partial, index);
            if (!target) {
                return unexpected(target.error());
            }
            larger = *target;
        }
        remaining -= (static_cast<int64_t>(*max) + 1) - values[index];
        auto carried = wrap_outermost ? larger->add_wrap_partial(partial, index - 1, values, 1)
                                      : larger->add_partial(partial, index - 1, values, 1);
        if (!carried) {
            return carried;
        }
        auto min = min_value_for(partial, values);
        if (!min) {
            return unexpected(min.error());
        }
        values[index] = *min;
    }

    while (remaining < 0) {
        auto min = min_value_for(partial, values);
        if (!min) {
            return unexpected(min.error());
        }
        int64_t proposed = static_cast<int64_t>(values[index]) + remaining;
        if (proposed >= *min) {
            values[index] = static_cast<int32_t>(proposed);
            break;
        }
        if (larger == nullptr) {
            if (index == 0) {
                if (!wrap_outermost) {
                    return make_carry_error(type(), "Maximum value exceeded for add");
                }
                remaining -= (static_cast<int64_t>(*min) - 1) - values[index];
                auto max = max_value_for(partial, values);
                if (!max) {
                    return unexpected(max.error());
                }
                values[index] = *max;
                continue;
            }
            auto target = carry_target(partial, index);
            if (!target) {
                return unexpected(target.error());
            }
            larger = *target;
        }
        remaining -= (static_cast<int64_t>(*min) - 1) - values[index];
        auto carried = wrap_outermost ? larger->add_wrap_partial(partial, index - 1, values, -1)
                                      : larger->add_partial(partial, index - 1, values, -1);
        if (!carried) {
            return carried;
        }
        auto max = max_value_for(partial, values);
        if (!max) {
            return unexpected(max.error());
        }
        values[index] = *max;
    }

    return set_partial(partial, index, values, values[index]);
}

inline FieldResult<int64_t> DateTimeField::round_ceiling(int64_t instant) const {
    auto floor = round_floor(instant);
    if (!floor) {
        return floor;
    }
    if (*floor != instant) {
        return add(*floor, 1);
    }
    return instant;
}

inline FieldResult<int64_t> DateTimeField::round_half_floor(int64_t instant) const {
    auto floor = round_floor(instant);
    if (!floor) {
        return floor;
    }
    auto ceiling = round_ceiling(instant);
    if (!ceiling) {
        return ceiling;
    }
    int64_t diff_from_floor = instant - *floor;
    int64_t diff_to_ceiling = *ceiling - instant;
    return diff_from_floor <= diff_to_ceiling ? *floor : *ceiling;
}

inline FieldResult<int64_t> DateTimeField::round_half_ceiling(int64_t instant) const {
    auto floor = round_floor(instant);
    if (!floor) {
        return floor;
    }
    auto ceiling = round_ceiling(instant);
    if (!ceiling) {
        return ceiling;
    }
    int64_t diff_from_floor = instant - *floor;
    int64_t diff_to_ceiling = *ceiling - instant;
    return diff_to_ceiling <= diff_from_floor ? *ceiling : *floor;
}

inline FieldResult<int64_t> DateTimeField::round_half_even(int64_t instant) const {
    auto floor = round_floor(instant);
    if (!floor) {
        return floor;
    }
    auto ceiling = round_ceiling(instant);
    if (!ceiling) {
        return ceiling;
    }
    int64_t diff_from_floor = instant - *floor;
    int64_t diff_to_ceiling = *ceiling - instant;
    if (diff_from_floor < diff_to_ceiling) {
        return *floor;
    }
    if (diff_to_ceiling < diff_from_floor) {
        return *ceiling;
    }
    // Halfway: pick whichever side gives this field an even value
    auto ceiling_value = get(*ceiling);
    if (!ceiling_value) {
        return unexpected(ceiling_value.error());
    }
    return (*ceiling_value & 1) == 0 ? *ceiling : *floor;
}

inline FieldResult<int64_t> DateTimeField::remainder(int64_t instant) const {
    return round_floor(instant).map([instant](int64_t floor) { return instant - floor; });
}

// =============================================================================
// Partial
// =============================================================================

inline FieldResult<void> Partial::check_order(const DateTimeField& larger,
                                              const DateTimeField& smaller) {
    auto larger_unit = larger.duration_field();
    auto smaller_unit = smaller.duration_field();
    auto order = larger_unit->compare(*smaller_unit);
    if (order < 0) {
        return make_argument_error("Fields must be in order largest-smallest: " +
                                   std::string(larger.name()) + " < " +
                                   std::string(smaller.name()));
    }
    if (order > 0) {
        return {};
    }

    // Same unit ("year" then "yearOfCentury"): the unbounded or wider range comes first
    auto larger_range = larger.range_duration_field();
    auto smaller_range = smaller.range_duration_field();
    if (larger.type() == smaller.type() || (!larger_range && !smaller_range)) {
        return make_argument_error("Fields must not contain duplicates: " +
                                   std::string(smaller.name()));
    }
    if (!larger_range) {
        return {};
    }
    if (!smaller_range) {
        return make_argument_error("Fields must be in order largest-smallest: " +
                                   std::string(larger.name()) + " < " +
                                   std::string(smaller.name()));
    }
    auto range_order = larger_range->compare(*smaller_range);
    if (range_order < 0) {
        return make_argument_error("Fields must be in order largest-smallest: " +
                                   std::string(larger.name()) + " < " +
                                   std::string(smaller.name()));
    }
    if (range_order == 0) {
        return make_argument_error("Fields must not contain duplicates: " +
                                   std::string(smaller.name()));
    }
    return {};
}

inline FieldResult<Partial> Partial::create(std::vector<FieldPtr> fields,
                                            std::vector<int32_t> values) {
    if (fields.size() != values.size()) {
        return make_argument_error("Values array must be the same length as the fields array");
    }
    for (size_t i = 0; i < fields.size(); ++i) {
        if (!fields[i]) {
            return make_argument_error("Fields array must not contain null");
        }
        if (!fields[i]->is_supported()) {
            return make_argument_error("Field " + std::string(fields[i]->name()) +
                                       " is not supported");
        }
        if (i > 0) {
            if (auto ordered = check_order(*fields[i - 1], *fields[i]); !ordered) {
                return unexpected(ordered.error());
            }
        }
    }

    Partial partial(std::move(fields), std::move(values));

    // Intrinsic bounds first, then bounds that depend on the larger fields
    for (size_t i = 0; i < partial.size(); ++i) {
        const DateTimeField& field = *partial.field(i);
        auto min = field.min_value();
        if (!min) {
            return unexpected(min.error());
        }
        auto max = field.max_value();
        if (!max) {
            return unexpected(max.error());
        }
        if (auto valid = verify_value_bounds(field.type(), partial.value(i), *min, *max); !valid) {
            return unexpected(valid.error());
        }
    }
    // Each field validates its own value, including values its bounds cannot express
    for (size_t i = 0; i < partial.size(); ++i) {
        std::vector<int32_t> scratch = partial.values_;
        if (auto valid = partial.field(i)->set_partial(partial, i, scratch, partial.value(i));
            !valid) {
            return unexpected(valid.error());
        }
    }
    return partial;
}

} // namespace calgebra
