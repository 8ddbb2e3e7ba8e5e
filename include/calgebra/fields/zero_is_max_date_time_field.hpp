#pragma once

#include "calgebra/date_time_field.hpp"

#include <memory>
#include <utility>

namespace calgebra {

/**
 * @brief Field that reports the wrapped field's zero as its maximum
 *
 * Turns a zero-based cycle into a one-based one: hour-of-day 0..23 becomes
 * clock-hour-of-day 1..24, where 24 stands for midnight. The wrapped field's
 * minimum must be 0.
 *
 * Arithmetic on instants (add, add_wrap_field, difference) and rounding are
 * performed by the wrapped field, since both fields change at the same
 * instants. Partial values are held in this field's own 1..max range, so the
 * partial operations use the defaults over this field's bounds.
 */
class ZeroIsMaxDateTimeField final : public DateTimeField {
public:
    using FieldPtr = std::shared_ptr<const ZeroIsMaxDateTimeField>;

    [[nodiscard]] static FieldResult<FieldPtr> create(std::shared_ptr<const DateTimeField> wrapped,
                                                      FieldKind kind) {
        if (!wrapped) {
            return make_argument_error("The field must not be null");
        }
        if (!wrapped->is_supported()) {
            return make_argument_error("The field must be supported");
        }
        auto wrapped_min = wrapped->min_value();
        if (!wrapped_min) {
            return unexpected(wrapped_min.error());
        }
        if (*wrapped_min != 0) {
            return make_argument_error("Wrapped field's minimum value must be zero");
        }
        return std::make_shared<ZeroIsMaxDateTimeField>(construct_tag{}, std::move(wrapped), kind);
    }

    [[nodiscard]] FieldKind type() const noexcept override { return kind_; }
    [[nodiscard]] bool is_lenient() const noexcept override { return wrapped_->is_lenient(); }

    [[nodiscard]] FieldResult<int32_t> get(int64_t instant) const override {
        auto value = wrapped_->get(instant);
        if (!value || *value != 0) {
            return value;
        }
        return max_value();
    }

    [[nodiscard]] FieldResult<int64_t> set(int64_t instant, int32_t value) const override {
        auto max = max_value();
        if (!max) {
            return unexpected(max.error());
        }
        if (auto valid = verify_value_bounds(kind_, value, 1, *max); !valid) {
            return unexpected(valid.error());
        }
        if (value == *max) {
            value = 0;
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

    [[nodiscard]] FieldResult<int32_t> min_value() const override { return 1; }

    [[nodiscard]] FieldResult<int32_t> min_value_at(int64_t /*instant*/) const override {
        return 1;
    }

    [[nodiscard]] FieldResult<int32_t> min_value_in(const Partial& /*partial*/) const override {
        return 1;
    }

    [[nodiscard]] FieldResult<int32_t>
    min_value_for(const Partial& /*partial*/, std::span<const int32_t> /*values*/) const override {
        return 1;
    }

    [[nodiscard]] FieldResult<int32_t> max_value() const override {
        return wrapped_->max_value().and_then(next_value);
    }

    [[nodiscard]] FieldResult<int32_t> max_value_at(int64_t instant) const override {
        return wrapped_->max_value_at(instant).and_then(next_value);
    }

    [[nodiscard]] FieldResult<int32_t> max_value_in(const Partial& partial) const override {
        return wrapped_->max_value_in(partial).and_then(next_value);
    }

    [[nodiscard]] FieldResult<int32_t>
    max_value_for(const Partial& partial, std::span<const int32_t> values) const override {
        return wrapped_->max_value_for(partial, values).and_then(next_value);
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
    ZeroIsMaxDateTimeField(construct_tag, std::shared_ptr<const DateTimeField> wrapped,
                           FieldKind kind) noexcept
        : wrapped_(std::move(wrapped)),
          kind_(kind) {}

private:
    static FieldResult<int32_t> next_value(int32_t value) { return safe_add_int(value, 1); }

    std::shared_ptr<const DateTimeField> wrapped_;
    FieldKind kind_;
};

} // namespace calgebra
