#pragma once

#include "calgebra/duration_field.hpp"

#include <memory>
#include <utility>

namespace calgebra {

/**
 * @brief Duration field whose unit is a fixed multiple of another field's unit
 *
 * A century is 100 years: values and differences are the wrapped field's
 * divided by the scalar, and millis and add multiply by it first. The scaled
 * field is precise exactly when the wrapped field is.
 */
class ScaledDurationField final : public DurationField {
public:
    /**
     * @param wrapped Supported duration field to scale
     * @param kind Duration kind reported by type()
     * @param scalar Units of wrapped per unit of this field; not 0 or 1
     */
    [[nodiscard]] static FieldResult<std::shared_ptr<const ScaledDurationField>>
    create(std::shared_ptr<const DurationField> wrapped, DurationKind kind, int32_t scalar) {
        if (!wrapped) {
            return make_argument_error("The field must not be null");
        }
        if (!wrapped->is_supported()) {
            return make_argument_error("The field must be supported");
        }
        if (scalar == 0 || scalar == 1) {
            return make_argument_error("The scalar must not be 0 or 1");
        }
        auto unit = safe_multiply(wrapped->unit_millis(), scalar);
        if (!unit) {
            return unexpected(unit.error());
        }
        return std::shared_ptr<const ScaledDurationField>(std::make_shared<ScaledDurationField>(
            construct_tag{}, std::move(wrapped), kind, scalar, *unit));
    }

    [[nodiscard]] DurationKind type() const noexcept override { return kind_; }
    [[nodiscard]] bool is_precise() const noexcept override { return wrapped_->is_precise(); }
    [[nodiscard]] int64_t unit_millis() const noexcept override { return unit_; }

    [[nodiscard]] int32_t scalar() const noexcept { return scalar_; }

    [[nodiscard]] const std::shared_ptr<const DurationField>& wrapped_field() const noexcept {
        return wrapped_;
    }

    [[nodiscard]] FieldResult<int64_t> value_as_long(int64_t duration) const override {
        return wrapped_->value_as_long(duration).map(
            [this](int64_t value) { return value / scalar_; });
    }

    [[nodiscard]] FieldResult<int64_t> value_as_long_at(int64_t duration,
                                                        int64_t instant) const override {
        return wrapped_->value_as_long_at(duration, instant)
            .map([this](int64_t value) { return value / scalar_; });
    }

    [[nodiscard]] FieldResult<int64_t> millis(int64_t value) const override {
        return safe_multiply(value, scalar_).and_then(
            [this](int64_t scaled) { return wrapped_->millis(scaled); });
    }

    [[nodiscard]] FieldResult<int64_t> millis_at(int64_t value, int64_t instant) const override {
        return safe_multiply(value, scalar_).and_then(
            [this, instant](int64_t scaled) { return wrapped_->millis_at(scaled, instant); });
    }

    [[nodiscard]] FieldResult<int64_t> add(int64_t instant, int64_t value) const override {
        return safe_multiply(value, scalar_).and_then(
            [this, instant](int64_t scaled) { return wrapped_->add(instant, scaled); });
    }

    [[nodiscard]] FieldResult<int64_t>
    difference_as_long(int64_t minuend_instant, int64_t subtrahend_instant) const override {
        return wrapped_->difference_as_long(minuend_instant, subtrahend_instant)
            .map([this](int64_t difference) { return difference / scalar_; });
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    ScaledDurationField(construct_tag, std::shared_ptr<const DurationField> wrapped,
                        DurationKind kind, int32_t scalar, int64_t unit) noexcept
        : wrapped_(std::move(wrapped)),
          kind_(kind),
          scalar_(scalar),
          unit_(unit) {}

private:
    std::shared_ptr<const DurationField> wrapped_;
    DurationKind kind_;
    int32_t scalar_;
    int64_t unit_;
};

} // namespace calgebra
