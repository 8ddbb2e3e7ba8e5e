#pragma once

#include "calgebra/date_time_field.hpp"

#include <memory>
#include <optional>
#include <utility>

namespace calgebra {

/**
 * @brief Field that omits one value from the wrapped field's sequence
 *
 * Typically wraps a proleptic year so that there is no year zero: wrapped
 * values at or below the skip value are reported one lower, so ..., -2, -1,
 * 1, 2, ... is observed. The skip value itself is never returned by get()
 * and set() rejects it.
 *
 * Every other operation is the wrapped field's. The adjusted minimum is
 * reported by all min_value overloads. Partial operations map this field's
 * slot into the wrapped field's values and back, so carries step over the
 * skip value.
 */
class SkipDateTimeField final : public DateTimeField {
public:
    using FieldPtr = std::shared_ptr<const SkipDateTimeField>;

    /**
     * @param wrapped Supported field whose value sequence contains skip
     * @param skip Value to omit
     */
    [[nodiscard]] static FieldResult<FieldPtr> create(std::shared_ptr<const DateTimeField> wrapped,
                                                      int32_t skip = 0) {
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
        FieldResult<int32_t> min = *wrapped_min;
        if (*wrapped_min < skip) {
            min = safe_add_int(*wrapped_min, -1);
        } else if (*wrapped_min == skip) {
            min = safe_add_int(skip, 1);
        }
        if (!min) {
            return unexpected(min.error());
        }
        return std::make_shared<SkipDateTimeField>(construct_tag{}, std::move(wrapped), skip, *min);
    }

    [[nodiscard]] FieldKind type() const noexcept override { return wrapped_->type(); }
    [[nodiscard]] bool is_lenient() const noexcept override { return wrapped_->is_lenient(); }

    [[nodiscard]] FieldResult<int32_t> get(int64_t instant) const override {
        return wrapped_->get(instant).and_then([this](int32_t value) -> FieldResult<int32_t> {
            if (value <= skip_) {
                return safe_add_int(value, -1);
            }
            return value;
        });
    }

    [[nodiscard]] FieldResult<int64_t> set(int64_t instant, int32_t value) const override {
        auto max = max_value();
        if (!max) {
            return unexpected(max.error());
        }
        if (auto valid = verify_value_bounds(type(), value, min_, *max); !valid) {
            return unexpected(valid.error());
        }
        if (value <= skip_) {
            if (value == skip_) {
                return make_value_error(type(), value, std::nullopt, std::nullopt);
            }
            ++value;
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
        return in_wrapped_space(index, values, [&] {
            return wrapped_->add_partial(partial, index, values, amount);
        });
    }

    [[nodiscard]] FieldResult<void> add_wrap_partial(const Partial& partial, size_t index,
                                                     std::span<int32_t> values,
                                                     int32_t amount) const override {
        return in_wrapped_space(index, values, [&] {
            return wrapped_->add_wrap_partial(partial, index, values, amount);
        });
    }

    [[nodiscard]] FieldResult<void> add_wrap_field_partial(const Partial& partial, size_t index,
                                                           std::span<int32_t> values,
                                                           int32_t amount) const override {
        return in_wrapped_space(index, values, [&] {
            return wrapped_->add_wrap_field_partial(partial, index, values, amount);
        });
    }

    [[nodiscard]] FieldResult<void> set_partial(const Partial& partial, size_t index,
                                                std::span<int32_t> values,
                                                int32_t value) const override {
        if (index >= values.size()) {
            return make_argument_error("Field index out of range");
        }
        if (value == skip_) {
            return make_value_error(type(), value, std::nullopt, std::nullopt);
        }
        auto max = max_value_for(partial, values);
        if (!max) {
            return unexpected(max.error());
        }
        if (auto valid = verify_value_bounds(type(), value, min_, *max); !valid) {
            return valid;
        }
        return in_wrapped_space(index, values, [&] {
            return wrapped_->set_partial(partial, index, values, to_wrapped(value));
        });
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

    [[nodiscard]] FieldResult<int32_t> min_value() const override { return min_; }

    [[nodiscard]] FieldResult<int32_t> min_value_at(int64_t /*instant*/) const override {
        return min_;
    }

    [[nodiscard]] FieldResult<int32_t> min_value_in(const Partial& /*partial*/) const override {
        return min_;
    }

    [[nodiscard]] FieldResult<int32_t>
    min_value_for(const Partial& /*partial*/, std::span<const int32_t> /*values*/) const override {
        return min_;
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

    [[nodiscard]] int32_t skip() const noexcept { return skip_; }

    [[nodiscard]] const std::shared_ptr<const DateTimeField>& wrapped_field() const noexcept {
        return wrapped_;
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    SkipDateTimeField(construct_tag, std::shared_ptr<const DateTimeField> wrapped, int32_t skip,
                      int32_t min) noexcept
        : wrapped_(std::move(wrapped)),
          skip_(skip),
          min_(min) {}

private:
    // Values below skip_ sit one higher in the wrapped field
    int32_t to_wrapped(int32_t value) const noexcept { return value < skip_ ? value + 1 : value; }

    FieldResult<int32_t> from_wrapped(int32_t value) const {
        if (value <= skip_) {
            return safe_add_int(value, -1);
        }
        return value;
    }

    /// Run a wrapped partial operation with this field's slot in the wrapped field's values
    template <typename Op>
    FieldResult<void> in_wrapped_space(size_t index, std::span<int32_t> values, Op&& op) const {
        if (index >= values.size()) {
            return make_argument_error("Field index out of range");
        }
        values[index] = to_wrapped(values[index]);
        if (auto result = op(); !result) {
            return result;
        }
        auto value = from_wrapped(values[index]);
        if (!value) {
            return unexpected(value.error());
        }
        values[index] = *value;
        return {};
    }

    std::shared_ptr<const DateTimeField> wrapped_;
    int32_t skip_;
    int32_t min_;
};

} // namespace calgebra
