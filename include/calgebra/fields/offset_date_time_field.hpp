#pragma once

#include "calgebra/date_time_field.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <utility>

namespace calgebra {

/**
 * @brief Field whose values are the wrapped field's shifted by a constant
 *
 * Bounds are the wrapped bounds plus the offset, optionally narrowed by
 * caller-supplied limits. add() re-checks that the result still lies within
 * the narrowed bounds. Rounding and leap queries are the wrapped field's.
 */
class OffsetDateTimeField final : public DateTimeField {
public:
    using FieldPtr = std::shared_ptr<const OffsetDateTimeField>;

    /// Offset wrapped, keeping its field kind
    [[nodiscard]] static FieldResult<FieldPtr> create(std::shared_ptr<const DateTimeField> wrapped,
                                                      int32_t offset) {
        if (!wrapped) {
            return make_argument_error("The field must not be null");
        }
        FieldKind kind = wrapped->type();
        return create(std::move(wrapped), kind, offset);
    }

    /**
     * @param wrapped Supported field to offset
     * @param kind Field kind reported by type()
     * @param offset Amount added to every value; not zero
     * @param min_value Lower limit, raised to the wrapped minimum plus offset if below it
     * @param max_value Upper limit, lowered to the wrapped maximum plus offset if above it
     */
    [[nodiscard]] static FieldResult<FieldPtr>
    create(std::shared_ptr<const DateTimeField> wrapped, FieldKind kind, int32_t offset,
           int32_t min_value = std::numeric_limits<int32_t>::min(),
           int32_t max_value = std::numeric_limits<int32_t>::max()) {
        if (!wrapped) {
            return make_argument_error("The field must not be null");
        }
        if (!wrapped->is_supported()) {
            return make_argument_error("The field must be supported");
        }
        if (offset == 0) {
            return make_argument_error("The offset cannot be zero");
        }

        auto wrapped_min = wrapped->min_value();
        if (!wrapped_min) {
            return unexpected(wrapped_min.error());
        }
        auto wrapped_max = wrapped->max_value();
        if (!wrapped_max) {
            return unexpected(wrapped_max.error());
        }
        auto min = safe_add_int(*wrapped_min, offset).map(
            [min_value](int32_t shifted) { return std::max(min_value, shifted); });
        if (!min) {
            return unexpected(min.error());
        }
        auto max = safe_add_int(*wrapped_max, offset).map(
            [max_value](int32_t shifted) { return std::min(max_value, shifted); });
        if (!max) {
            return unexpected(max.error());
        }
        return std::make_shared<OffsetDateTimeField>(construct_tag{}, std::move(wrapped), kind,
                                                     offset, *min, *max);
    }

    [[nodiscard]] FieldKind type() const noexcept override { return kind_; }
    [[nodiscard]] bool is_lenient() const noexcept override { return wrapped_->is_lenient(); }

    [[nodiscard]] FieldResult<int32_t> get(int64_t instant) const override {
        return wrapped_->get(instant).and_then(
            [this](int32_t value) { return safe_add_int(value, offset_); });
    }

    [[nodiscard]] FieldResult<int64_t> set(int64_t instant, int32_t value) const override {
        if (auto valid = verify_value_bounds(kind_, value, min_, max_); !valid) {
            return unexpected(valid.error());
        }
        // value is within the shifted wrapped bounds, so the subtraction cannot overflow
        return wrapped_->set(instant, value - offset_);
    }

    [[nodiscard]] FieldResult<int64_t> add(int64_t instant, int64_t amount) const override {
        auto moved = wrapped_->add(instant, amount);
        if (!moved) {
            return moved;
        }
        auto value = get(*moved);
        if (!value) {
            return unexpected(value.error());
        }
        if (auto valid = verify_value_bounds(kind_, *value, min_, max_); !valid) {
            return unexpected(valid.error());
        }
        return moved;
    }

    [[nodiscard]] FieldResult<int64_t> add_wrap_field(int64_t instant,
                                                      int32_t amount) const override {
        auto current = get(instant);
        if (!current) {
            return unexpected(current.error());
        }
        auto wrapped = get_wrapped_value(*current, amount, min_, max_);
        if (!wrapped) {
            return unexpected(wrapped.error());
        }
        return set(instant, *wrapped);
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
    [[nodiscard]] FieldResult<int32_t> max_value() const override { return max_; }

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

    [[nodiscard]] int32_t offset() const noexcept { return offset_; }

    [[nodiscard]] const std::shared_ptr<const DateTimeField>& wrapped_field() const noexcept {
        return wrapped_;
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    OffsetDateTimeField(construct_tag, std::shared_ptr<const DateTimeField> wrapped, FieldKind kind,
                        int32_t offset, int32_t min, int32_t max) noexcept
        : wrapped_(std::move(wrapped)),
          kind_(kind),
          offset_(offset),
          min_(min),
          max_(max) {}

private:
    std::shared_ptr<const DateTimeField> wrapped_;
    FieldKind kind_;
    int32_t offset_;
    int32_t min_;
    int32_t max_;
};

} // namespace calgebra
