#pragma once

#include "calgebra/date_time_field.hpp"
#include "calgebra/detail/floor_math.hpp"
#include "calgebra/fields/divided_date_time_field.hpp"
#include "calgebra/fields/scaled_duration_field.hpp"

#include <memory>
#include <string>
#include <utility>

namespace calgebra {

/**
 * @brief Field reporting the wrapped field's value modulo a constant
 *
 * Year-of-century is year-of-era modulo 100, always in [0, divisor - 1]
 * (year -43 has year-of-century 57). The unit is the wrapped field's unit and
 * the range is that unit scaled by the divisor. set() keeps the divided part
 * of the wrapped value, and every rounding operation is the wrapped field's.
 */
class RemainderDateTimeField final : public DateTimeField {
public:
    using FieldPtr = std::shared_ptr<const RemainderDateTimeField>;

    /// Remainder of wrapped, with a range of divisor wrapped units
    [[nodiscard]] static FieldResult<FieldPtr>
    create(std::shared_ptr<const DateTimeField> wrapped, FieldKind kind, int32_t divisor) {
        if (auto valid = check(wrapped, divisor); !valid) {
            return unexpected(valid.error());
        }
        auto range_type = range_kind(kind);
        if (!range_type) {
            return make_argument_error("Field " + std::string(field_kind_name(kind)) +
                                       " has no range duration");
        }
        auto range = ScaledDurationField::create(wrapped->duration_field(), *range_type, divisor);
        if (!range) {
            return unexpected(range.error());
        }
        auto unit = wrapped->duration_field();
        return std::make_shared<RemainderDateTimeField>(construct_tag{}, std::move(wrapped),
                                                        std::move(unit), *std::move(range), kind,
                                                        divisor);
    }

    /// Remainder of wrapped with an explicit range duration field
    [[nodiscard]] static FieldResult<FieldPtr>
    create(std::shared_ptr<const DateTimeField> wrapped,
           std::shared_ptr<const DurationField> range, FieldKind kind, int32_t divisor) {
        if (auto valid = check(wrapped, divisor); !valid) {
            return unexpected(valid.error());
        }
        auto unit = wrapped->duration_field();
        return std::make_shared<RemainderDateTimeField>(construct_tag{}, std::move(wrapped),
                                                        std::move(unit), std::move(range), kind,
                                                        divisor);
    }

    /// Complement of divided, keeping its field kind
    [[nodiscard]] static FieldResult<FieldPtr> create_from(const DividedDateTimeField& divided) {
        return create_from(divided, divided.type());
    }

    /// Complement of divided, using the wrapped unit
    [[nodiscard]] static FieldResult<FieldPtr> create_from(const DividedDateTimeField& divided,
                                                           FieldKind kind) {
        return create_from(divided, divided.wrapped_field()->duration_field(), kind);
    }

    /**
     * @brief Complement of divided
     *
     * The divided field's unit becomes this field's range.
     */
    [[nodiscard]] static FieldResult<FieldPtr>
    create_from(const DividedDateTimeField& divided, std::shared_ptr<const DurationField> unit,
                FieldKind kind) {
        if (!unit) {
            return make_argument_error("The duration field must not be null");
        }
        return std::make_shared<RemainderDateTimeField>(construct_tag{}, divided.wrapped_field(),
                                                        std::move(unit), divided.duration_field(),
                                                        kind, divided.divisor());
    }

    [[nodiscard]] FieldKind type() const noexcept override { return kind_; }
    [[nodiscard]] bool is_lenient() const noexcept override { return wrapped_->is_lenient(); }

    [[nodiscard]] FieldResult<int32_t> get(int64_t instant) const override {
        return wrapped_->get(instant).map(
            [this](int32_t value) { return detail::floor_mod(value, divisor_); });
    }

    [[nodiscard]] FieldResult<int64_t> set(int64_t instant, int32_t value) const override {
        if (auto valid = verify_value_bounds(kind_, value, 0, divisor_ - 1); !valid) {
            return unexpected(valid.error());
        }
        auto current = wrapped_->get(instant);
        if (!current) {
            return unexpected(current.error());
        }
        int32_t divided = detail::floor_div(*current, divisor_);
        auto rebuilt = safe_multiply_int(divided, divisor_).and_then(
            [value](int32_t base) { return safe_add_int(base, value); });
        if (!rebuilt) {
            return unexpected(rebuilt.error());
        }
        return wrapped_->set(instant, *rebuilt);
    }

    [[nodiscard]] FieldResult<int64_t> add_wrap_field(int64_t instant,
                                                      int32_t amount) const override {
        auto current = get(instant);
        if (!current) {
            return unexpected(current.error());
        }
        auto wrapped = get_wrapped_value(*current, amount, 0, divisor_ - 1);
        if (!wrapped) {
            return unexpected(wrapped.error());
        }
        return set(instant, *wrapped);
    }

    [[nodiscard]] std::shared_ptr<const DurationField> duration_field() const override {
        return unit_;
    }

    [[nodiscard]] std::shared_ptr<const DurationField> range_duration_field() const override {
        return range_;
    }

    [[nodiscard]] FieldResult<int32_t> min_value() const override { return 0; }
    [[nodiscard]] FieldResult<int32_t> max_value() const override { return divisor_ - 1; }

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

    [[nodiscard]] int32_t divisor() const noexcept { return divisor_; }

    [[nodiscard]] const std::shared_ptr<const DateTimeField>& wrapped_field() const noexcept {
        return wrapped_;
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    RemainderDateTimeField(construct_tag, std::shared_ptr<const DateTimeField> wrapped,
                           std::shared_ptr<const DurationField> unit,
                           std::shared_ptr<const DurationField> range, FieldKind kind,
                           int32_t divisor) noexcept
        : wrapped_(std::move(wrapped)),
          unit_(std::move(unit)),
          range_(std::move(range)),
          kind_(kind),
          divisor_(divisor) {}

private:
    static FieldResult<void> check(const std::shared_ptr<const DateTimeField>& wrapped,
                                   int32_t divisor) {
        if (!wrapped) {
            return make_argument_error("The field must not be null");
        }
        if (!wrapped->is_supported()) {
            return make_argument_error("The field must be supported");
        }
        if (divisor < 2) {
            return make_argument_error("The divisor must be at least 2");
        }
        return {};
    }

    std::shared_ptr<const DateTimeField> wrapped_;
    std::shared_ptr<const DurationField> unit_;
    std::shared_ptr<const DurationField> range_;
    FieldKind kind_;
    int32_t divisor_;
};

inline FieldResult<DividedDateTimeField::FieldPtr>
DividedDateTimeField::create_from(const RemainderDateTimeField& remainder,
                                  std::shared_ptr<const DurationField> range, FieldKind kind) {
    auto unit = remainder.range_duration_field();
    if (!unit) {
        return make_argument_error("The remainder field must have a range duration field");
    }
    return build(remainder.wrapped_field(), std::move(unit), std::move(range), kind,
                 remainder.divisor());
}

} // namespace calgebra
