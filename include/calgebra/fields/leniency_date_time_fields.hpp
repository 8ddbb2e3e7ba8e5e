#pragma once

#include "calgebra/date_time_field.hpp"

#include <memory>
#include <utility>

namespace calgebra {

/**
 * @brief Time-zone services a LenientDateTimeField needs from its chronology
 *
 * The zone rules are opaque to the field algebra; lenient set() only needs
 * to move between UTC and local time and to reach the non-lenient sibling
 * field of a UTC-fixed chronology.
 */
class LenientContext {
public:
    virtual ~LenientContext() = default;

    /// Local wall time corresponding to a UTC instant
    [[nodiscard]] virtual int64_t utc_to_local(int64_t instant) const = 0;

    /**
     * UTC instant corresponding to a local wall time
     *
     * @param local_instant Local wall time in milliseconds
     * @param strict Fail on gap or overlap instead of resolving it
     * @param original_instant Instant used to pick an offset during overlaps
     */
    [[nodiscard]] virtual FieldResult<int64_t> local_to_utc(int64_t local_instant, bool strict,
                                                            int64_t original_instant) const = 0;

    /// Field of the given kind in the UTC variant of the chronology, or null
    [[nodiscard]] virtual std::shared_ptr<const DateTimeField> utc_field(FieldKind kind) const = 0;
};

class StrictDateTimeField;

/**
 * @brief Field whose set() rolls out-of-range values into larger fields
 *
 * Setting day-of-month 32 in January yields February 1st: instead of checking
 * bounds, set() adds the signed difference from the current value in local
 * time and converts back to UTC. Everything else is the wrapped field's.
 */
class LenientDateTimeField final : public DateTimeField {
public:
    /**
     * @brief Make field lenient
     *
     * A StrictDateTimeField is unwrapped first. A field that is already
     * lenient is returned unchanged.
     */
    [[nodiscard]] static FieldResult<std::shared_ptr<const DateTimeField>>
    create(std::shared_ptr<const DateTimeField> field,
           std::shared_ptr<const LenientContext> context);

    [[nodiscard]] FieldKind type() const noexcept override { return wrapped_->type(); }
    [[nodiscard]] bool is_lenient() const noexcept override { return true; }

    [[nodiscard]] FieldResult<int32_t> get(int64_t instant) const override {
        return wrapped_->get(instant);
    }

    [[nodiscard]] FieldResult<int64_t> set(int64_t instant, int32_t value) const override {
        auto current = get(instant);
        if (!current) {
            return unexpected(current.error());
        }
        auto utc_field = context_->utc_field(type());
        if (!utc_field) {
            return make_unsupported_error(type());
        }
        int64_t local = context_->utc_to_local(instant);
        auto moved = utc_field->add(local, static_cast<int64_t>(value) - *current);
        if (!moved) {
            return moved;
        }
        return context_->local_to_utc(*moved, false, instant);
    }

    [[nodiscard]] FieldResult<int64_t> add(int64_t instant, int64_t amount) const override {
        return wrapped_->add(instant, amount);
    }

    [[nodiscard]] FieldResult<int64_t> add_wrap_field(int64_t instant,
                                                      int32_t amount) const override {
        return wrapped_->add_wrap_field(instant, amount);
    }

    [[nodiscard]] FieldResult<void> add_partial(const Partial& partial, size_t index,
                                                std::span<int32_t> values,
                                                int32_t amount) const override {
        return wrapped_->add_partial(partial, index, values, amount);
    }

    [[nodiscard]] FieldResult<void> add_wrap_partial(const Partial& partial, size_t index,
                                                     std::span<int32_t> values,
                                                     int32_t amount) const override {
        return wrapped_->add_wrap_partial(partial, index, values, amount);
    }

    [[nodiscard]] FieldResult<void> add_wrap_field_partial(const Partial& partial, size_t index,
                                                           std::span<int32_t> values,
                                                           int32_t amount) const override {
        return wrapped_->add_wrap_field_partial(partial, index, values, amount);
    }

    [[nodiscard]] FieldResult<void> set_partial(const Partial& partial, size_t index,
                                                std::span<int32_t> values,
                                                int32_t value) const override {
        return wrapped_->set_partial(partial, index, values, value);
    }

    [[nodiscard]] FieldResult<int32_t> difference(int64_t minuend_instant,
                                                  int64_t subtrahend_instant) const override {
        return wrapped_->difference(minuend_instant, subtrahend_instant);
    }

    [[nodiscard]] FieldResult<int64_t>
    difference_as_long(int64_t minuend_instant, int64_t subtrahend_instant) const override {
        return wrapped_->difference_as_long(minuend_instant, subtrahend_instant);
    }

    [[nodiscard]] std::shared_ptr<const DurationField> duration_field() const override {
        return wrapped_->duration_field();
    }

    [[nodiscard]] std::shared_ptr<const DurationField> range_duration_field() const override {
        return wrapped_->range_duration_field();
    }

    [[nodiscard]] FieldResult<bool> is_leap(int64_t instant) const override {
        return wrapped_->is_leap(instant);
    }

    [[nodiscard]] FieldResult<int32_t> leap_amount(int64_t instant) const override {
        return wrapped_->leap_amount(instant);
    }

    [[nodiscard]] std::shared_ptr<const DurationField> leap_duration_field() const override {
        return wrapped_->leap_duration_field();
    }

    [[nodiscard]] FieldResult<int32_t> min_value() const override {
        return wrapped_->min_value();
    }

    [[nodiscard]] FieldResult<int32_t> min_value_at(int64_t instant) const override {
        return wrapped_->min_value_at(instant);
    }

    [[nodiscard]] FieldResult<int32_t> min_value_in(const Partial& partial) const override {
        return wrapped_->min_value_in(partial);
    }

    [[nodiscard]] FieldResult<int32_t>
    min_value_for(const Partial& partial, std::span<const int32_t> values) const override {
        return wrapped_->min_value_for(partial, values);
    }

    [[nodiscard]] FieldResult<int32_t> max_value() const override {
        return wrapped_->max_value();
    }

    [[nodiscard]] FieldResult<int32_t> max_value_at(int64_t instant) const override {
        return wrapped_->max_value_at(instant);
    }

    [[nodiscard]] FieldResult<int32_t> max_value_in(const Partial& partial) const override {
        return wrapped_->max_value_in(partial);
    }

    [[nodiscard]] FieldResult<int32_t>
    max_value_for(const Partial& partial, std::span<const int32_t> values) const override {
        return wrapped_->max_value_for(partial, values);
    }

    [[nodiscard]] FieldResult<int64_t> round_floor(int64_t instant) const override {
        return wrapped_->round_floor(instant);
    }

    [[nodiscard]] FieldResult<int64_t> round_ceiling(int64_t instant) const override {
        return wrapped_->round_ceiling(instant);
    }

    [[nodiscard]] FieldResult<int64_t> round_half_floor(int64_t instant) const override {
        return wrapped_->round_half_floor(instant);
    }

    [[nodiscard]] FieldResult<int64_t> round_half_ceiling(int64_t instant) const override {
        return wrapped_->round_half_ceiling(instant);
    }

    [[nodiscard]] FieldResult<int64_t> round_half_even(int64_t instant) const override {
        return wrapped_->round_half_even(instant);
    }

    [[nodiscard]] FieldResult<int64_t> remainder(int64_t instant) const override {
        return wrapped_->remainder(instant);
    }

    [[nodiscard]] const std::shared_ptr<const DateTimeField>& wrapped_field() const noexcept {
        return wrapped_;
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    LenientDateTimeField(construct_tag, std::shared_ptr<const DateTimeField> wrapped,
                         std::shared_ptr<const LenientContext> context) noexcept
        : wrapped_(std::move(wrapped)),
          context_(std::move(context)) {}

private:
    std::shared_ptr<const DateTimeField> wrapped_;
    std::shared_ptr<const LenientContext> context_;
};

/**
 * @brief Field whose set() always checks the instant-dependent bounds
 *
 * Used to turn a lenient field strict again. Everything else is the wrapped
 * field's.
 */
class StrictDateTimeField final : public DateTimeField {
public:
    /**
     * @brief Make field strict
     *
     * A LenientDateTimeField is unwrapped first. A field that is already
     * strict is returned unchanged.
     */
    [[nodiscard]] static FieldResult<std::shared_ptr<const DateTimeField>>
    create(std::shared_ptr<const DateTimeField> field);

    [[nodiscard]] FieldKind type() const noexcept override { return wrapped_->type(); }
    [[nodiscard]] bool is_lenient() const noexcept override { return false; }

    [[nodiscard]] FieldResult<int32_t> get(int64_t instant) const override {
        return wrapped_->get(instant);
    }

    [[nodiscard]] FieldResult<int64_t> set(int64_t instant, int32_t value) const override {
        auto min = min_value_at(instant);
        if (!min) {
            return unexpected(min.error());
        }
        auto max = max_value_at(instant);
        if (!max) {
            return unexpected(max.error());
        }
        if (auto valid = verify_value_bounds(type(), value, *min, *max); !valid) {
            return unexpected(valid.error());
        }
        return wrapped_->set(instant, value);
    }

    [[nodiscard]] FieldResult<int64_t> add(int64_t instant, int64_t amount) const override {
        return wrapped_->add(instant, amount);
    }

    [[nodiscard]] FieldResult<int64_t> add_wrap_field(int64_t instant,
                                                      int32_t amount) const override {
        return wrapped_->add_wrap_field(instant, amount);
    }

    [[nodiscard]] FieldResult<void> add_partial(const Partial& partial, size_t index,
                                                std::span<int32_t> values,
                                                int32_t amount) const override {
        return wrapped_->add_partial(partial, index, values, amount);
    }

    [[nodiscard]] FieldResult<void> add_wrap_partial(const Partial& partial, size_t index,
                                                     std::span<int32_t> values,
                                                     int32_t amount) const override {
        return wrapped_->add_wrap_partial(partial, index, values, amount);
    }

    [[nodiscard]] FieldResult<void> add_wrap_field_partial(const Partial& partial, size_t index,
                                                           std::span<int32_t> values,
                                                           int32_t amount) const override {
        return wrapped_->add_wrap_field_partial(partial, index, values, amount);
    }

    [[nodiscard]] FieldResult<void> set_partial(const Partial& partial, size_t index,
                                                std::span<int32_t> values,
                                                int32_t value) const override {
        return wrapped_->set_partial(partial, index, values, value);
    }

    [[nodiscard]] FieldResult<int32_t> difference(int64_t minuend_instant,
                                                  int64_t subtrahend_instant) const override {
        return wrapped_->difference(minuend_instant, subtrahend_instant);
    }

    [[nodiscard]] FieldResult<int64_t>
    difference_as_long(int64_t minuend_instant, int64_t subtrahend_instant) const override {
        return wrapped_->difference_as_long(minuend_instant, subtrahend_instant);
    }

    [[nodiscard]] std::shared_ptr<const DurationField> duration_field() const override {
        return wrapped_->duration_field();
    }

    [[nodiscard]] std::shared_ptr<const DurationField> range_duration_field() const override {
        return wrapped_->range_duration_field();
    }

    [[nodiscard]] FieldResult<bool> is_leap(int64_t instant) const override {
        return wrapped_->is_leap(instant);
    }

    [[nodiscard]] FieldResult<int32_t> leap_amount(int64_t instant) const override {
        return wrapped_->leap_amount(instant);
    }

    [[nodiscard]] std::shared_ptr<const DurationField> leap_duration_field() const override {
        return wrapped_->leap_duration_field();
    }

    [[nodiscard]] FieldResult<int32_t> min_value() const override {
        return wrapped_->min_value();
    }

    [[nodiscard]] FieldResult<int32_t> min_value_at(int64_t instant) const override {
        return wrapped_->min_value_at(instant);
    }

    [[nodiscard]] FieldResult<int32_t> min_value_in(const Partial& partial) const override {
        return wrapped_->min_value_in(partial);
    }

    [[nodiscard]] FieldResult<int32_t>
    min_value_for(const Partial& partial, std::span<const int32_t> values) const override {
        return wrapped_->min_value_for(partial, values);
    }

    [[nodiscard]] FieldResult<int32_t> max_value() const override {
        return wrapped_->max_value();
    }

    [[nodiscard]] FieldResult<int32_t> max_value_at(int64_t instant) const override {
        return wrapped_->max_value_at(instant);
    }

    [[nodiscard]] FieldResult<int32_t> max_value_in(const Partial& partial) const override {
        return wrapped_->max_value_in(partial);
    }

    [[nodiscard]] FieldResult<int32_t>
    max_value_for(const Partial& partial, std::span<const int32_t> values) const override {
        return wrapped_->max_value_for(partial, values);
    }

    [[nodiscard]] FieldResult<int64_t> round_floor(int64_t instant) const override {
        return wrapped_->round_floor(instant);
    }

    [[nodiscard]] FieldResult<int64_t> round_ceiling(int64_t instant) const override {
        return wrapped_->round_ceiling(instant);
    }

    [[nodiscard]] FieldResult<int64_t> round_half_floor(int64_t instant) const override {
        return wrapped_->round_half_floor(instant);
    }

    [[nodiscard]] FieldResult<int64_t> round_half_ceiling(int64_t instant) const override {
        return wrapped_->round_half_ceiling(instant);
    }

    [[nodiscard]] FieldResult<int64_t> round_half_even(int64_t instant) const override {
        return wrapped_->round_half_even(instant);
    }

    [[nodiscard]] FieldResult<int64_t> remainder(int64_t instant) const override {
        return wrapped_->remainder(instant);
    }

    [[nodiscard]] const std::shared_ptr<const DateTimeField>& wrapped_field() const noexcept {
        return wrapped_;
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    StrictDateTimeField(construct_tag, std::shared_ptr<const DateTimeField> wrapped) noexcept
        : wrapped_(std::move(wrapped)) {}

private:
    std::shared_ptr<const DateTimeField> wrapped_;
};

inline FieldResult<std::shared_ptr<const DateTimeField>>
LenientDateTimeField::create(std::shared_ptr<const DateTimeField> field,
                             std::shared_ptr<const LenientContext> context) {
    if (!field) {
        return make_argument_error("The field must not be null");
    }
    if (!context) {
        return make_argument_error("The lenient context must not be null");
    }
    if (const auto* strict = dynamic_cast<const StrictDateTimeField*>(field.get())) {
        field = strict->wrapped_field();
    }
    if (field->is_lenient()) {
        return field;
    }
    return std::shared_ptr<const DateTimeField>(std::make_shared<LenientDateTimeField>(
        construct_tag{}, std::move(field), std::move(context)));
}

inline FieldResult<std::shared_ptr<const DateTimeField>>
StrictDateTimeField::create(std::shared_ptr<const DateTimeField> field) {
    if (!field) {
        return make_argument_error("The field must not be null");
    }
    if (const auto* lenient = dynamic_cast<const LenientDateTimeField*>(field.get())) {
        field = lenient->wrapped_field();
    }
    if (!field->is_lenient()) {
        return field;
    }
    return std::shared_ptr<const DateTimeField>(
        std::make_shared<StrictDateTimeField>(construct_tag{}, std::move(field)));
}

} // namespace calgebra
