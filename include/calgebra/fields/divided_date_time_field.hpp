#pragma once

#include "calgebra/date_time_field.hpp"
#include "calgebra/detail/floor_math.hpp"
#include "calgebra/fields/scaled_duration_field.hpp"

#include <memory>
#include <utility>

namespace calgebra {

class RemainderDateTimeField;

/**
 * @brief Field reporting the wrapped field's value divided by a constant
 *
 * Century-of-era is year-of-era divided by 100. Division uses floor
 * semantics so negative wrapped values land in the lower bucket
 * (year -43 is century -1). The unit is the wrapped unit scaled by the
 * divisor; set() keeps the wrapped field's remainder intact.
 *
 * RemainderDateTimeField is the complement: for every instant
 * divided.get(t) * divisor + remainder.get(t) == wrapped.get(t).
 */
class DividedDateTimeField final : public DateTimeField {
public:
    using FieldPtr = std::shared_ptr<const DividedDateTimeField>;

    /// Divide wrapped, inheriting its range duration field
    [[nodiscard]] static FieldResult<FieldPtr>
    create(std::shared_ptr<const DateTimeField> wrapped, FieldKind kind, int32_t divisor) {
        if (!wrapped) {
            return make_argument_error("The field must not be null");
        }
        auto range = wrapped->range_duration_field();
        return create(std::move(wrapped), std::move(range), kind, divisor);
    }

    /**
     * @param wrapped Supported field to divide
     * @param range Range duration field, or null to use the wrapped field's
     * @param kind Field kind reported by type()
     * @param divisor At least 2
     */
    [[nodiscard]] static FieldResult<FieldPtr>
    create(std::shared_ptr<const DateTimeField> wrapped,
           std::shared_ptr<const DurationField> range, FieldKind kind, int32_t divisor) {
        if (!wrapped) {
            return make_argument_error("The field must not be null");
        }
        if (!wrapped->is_supported()) {
            return make_argument_error("The field must be supported");
        }
        if (divisor < 2) {
            return make_argument_error("The divisor must be at least 2");
        }
        auto unit = ScaledDurationField::create(wrapped->duration_field(), unit_kind(kind),
                                                divisor);
        if (!unit) {
            return unexpected(unit.error());
        }
        return build(std::move(wrapped), *std::move(unit), std::move(range), kind, divisor);
    }

    /**
     * @brief Build the divided complement of a remainder field
     *
     * Reuses the remainder's divisor, and its range duration field becomes
     * this field's unit. Defined in remainder_date_time_field.hpp.
     */
    [[nodiscard]] static FieldResult<FieldPtr>
    create_from(const RemainderDateTimeField& remainder,
                std::shared_ptr<const DurationField> range, FieldKind kind);

    [[nodiscard]] FieldKind type() const noexcept override { return kind_; }
    [[nodiscard]] bool is_lenient() const noexcept override { return wrapped_->is_lenient(); }

    [[nodiscard]] FieldResult<int32_t> get(int64_t instant) const override {
        return wrapped_->get(instant).map(
            [this](int32_t value) { return detail::floor_div(value, divisor_); });
    }

    [[nodiscard]] FieldResult<int64_t> set(int64_t instant, int32_t value) const override {
        if (auto valid = verify_value_bounds(kind_, value, min_, max_); !valid) {
            return unexpected(valid.error());
        }
        auto current = wrapped_->get(instant);
        if (!current) {
            return unexpected(current.error());
        }
        int32_t kept = detail::floor_mod(*current, divisor_);
        auto scaled = safe_multiply_int(value, divisor_).and_then(
            [kept](int32_t base) { return safe_add_int(base, kept); });
        if (!scaled) {
            return unexpected(scaled.error());
        }
        return wrapped_->set(instant, *scaled);
    }

    [[nodiscard]] FieldResult<int64_t> add(int64_t instant, int64_t amount) const override {
        return safe_multiply(amount, divisor_).and_then(
            [this, instant](int64_t scaled) { return wrapped_->add(instant, scaled); });
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

    [[nodiscard]] FieldResult<int32_t> difference(int64_t minuend_instant,
                                                  int64_t subtrahend_instant) const override {
        return wrapped_->difference(minuend_instant, subtrahend_instant)
            .map([this](int32_t difference) { return difference / divisor_; });
    }

    [[nodiscard]] FieldResult<int64_t>
    difference_as_long(int64_t minuend_instant, int64_t subtrahend_instant) const override {
        return wrapped_->difference_as_long(minuend_instant, subtrahend_instant)
            .map([this](int64_t difference) { return difference / divisor_; });
    }

    [[nodiscard]] std::shared_ptr<const DurationField> duration_field() const override {
        return unit_;
    }

    [[nodiscard]] std::shared_ptr<const DurationField> range_duration_field() const override {
        if (range_) {
            return range_;
        }
        return wrapped_->range_duration_field();
    }

    [[nodiscard]] FieldResult<int32_t> min_value() const override { return min_; }
    [[nodiscard]] FieldResult<int32_t> max_value() const override { return max_; }

    [[nodiscard]] FieldResult<int64_t> round_floor(int64_t instant) const override {
        auto current = get(instant);
        if (!current) {
            return unexpected(current.error());
        }
        auto scaled = safe_multiply_int(*current, divisor_);
        if (!scaled) {
            return unexpected(scaled.error());
        }
        return wrapped_->set(instant, *scaled).and_then(
            [this](int64_t aligned) { return wrapped_->round_floor(aligned); });
    }

    [[nodiscard]] FieldResult<int64_t> remainder(int64_t instant) const override {
        auto wrapped_remainder = wrapped_->remainder(instant);
        if (!wrapped_remainder) {
            return wrapped_remainder;
        }
        auto value = get(*wrapped_remainder);
        if (!value) {
            return unexpected(value.error());
        }
        return set(instant, *value);
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
    DividedDateTimeField(construct_tag, std::shared_ptr<const DateTimeField> wrapped,
                         std::shared_ptr<const DurationField> unit,
                         std::shared_ptr<const DurationField> range, FieldKind kind,
                         int32_t divisor, int32_t min, int32_t max) noexcept
        : wrapped_(std::move(wrapped)),
          unit_(std::move(unit)),
          range_(std::move(range)),
          kind_(kind),
          divisor_(divisor),
          min_(min),
          max_(max) {}

private:
    static FieldResult<FieldPtr> build(std::shared_ptr<const DateTimeField> wrapped,
                                       std::shared_ptr<const DurationField> unit,
                                       std::shared_ptr<const DurationField> range,
                                       FieldKind kind, int32_t divisor) {
        auto wrapped_min = wrapped->min_value();
        if (!wrapped_min) {
            return unexpected(wrapped_min.error());
        }
        auto wrapped_max = wrapped->max_value();
        if (!wrapped_max) {
            return unexpected(wrapped_max.error());
        }
        int32_t min = detail::floor_div(*wrapped_min, divisor);
        int32_t max = detail::floor_div(*wrapped_max, divisor);
        return std::make_shared<DividedDateTimeField>(construct_tag{}, std::move(wrapped),
                                                      std::move(unit), std::move(range), kind,
                                                      divisor, min, max);
    }

    std::shared_ptr<const DateTimeField> wrapped_;
    std::shared_ptr<const DurationField> unit_;
    std::shared_ptr<const DurationField> range_;
    FieldKind kind_;
    int32_t divisor_;
    int32_t min_;
    int32_t max_;
};

} // namespace calgebra
