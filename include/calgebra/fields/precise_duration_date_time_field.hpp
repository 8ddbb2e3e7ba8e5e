#pragma once

#include "calgebra/date_time_field.hpp"
#include "calgebra/detail/floor_math.hpp"

#include <memory>
#include <utility>

namespace calgebra {

/**
 * @brief Base for fields whose unit has a fixed length in milliseconds
 *
 * Supplies set(), round_floor(), round_ceiling() and remainder() from the
 * unit length alone, aligned to the epoch. Subclasses provide get(), the
 * range duration field and the maximum value.
 *
 * Subclass factories call check_unit() before constructing, since the
 * constructor itself cannot fail.
 */
class PreciseDurationDateTimeField : public DateTimeField {
public:
    [[nodiscard]] FieldKind type() const noexcept override { return kind_; }
    [[nodiscard]] bool is_lenient() const noexcept override { return false; }

    [[nodiscard]] FieldResult<int64_t> set(int64_t instant, int32_t value) const override {
        auto min = min_value();
        if (!min) {
            return unexpected(min.error());
        }
        auto max = max_value_for_set(instant, value);
        if (!max) {
            return unexpected(max.error());
        }
        if (auto valid = verify_value_bounds(kind_, value, *min, *max); !valid) {
            return unexpected(valid.error());
        }
        auto current = get(instant);
        if (!current) {
            return unexpected(current.error());
        }
        return safe_multiply(static_cast<int64_t>(value) - *current, unit_millis_)
            .and_then([instant](int64_t delta) { return safe_add(instant, delta); });
    }

    [[nodiscard]] FieldResult<int64_t> round_floor(int64_t instant) const override {
        return detail::align_floor(instant, unit_millis_);
    }

    [[nodiscard]] FieldResult<int64_t> round_ceiling(int64_t instant) const override {
        return detail::align_ceiling(instant, unit_millis_);
    }

    [[nodiscard]] FieldResult<int64_t> remainder(int64_t instant) const override {
        return detail::align_remainder(instant, unit_millis_);
    }

    [[nodiscard]] std::shared_ptr<const DurationField> duration_field() const override {
        return unit_;
    }

    [[nodiscard]] FieldResult<int32_t> min_value() const override { return 0; }

    [[nodiscard]] int64_t unit_millis() const noexcept { return unit_millis_; }

protected:
    /// The unit must be precise and at least one millisecond long
    static FieldResult<void> check_unit(const std::shared_ptr<const DurationField>& unit) {
        if (!unit) {
            return make_argument_error("The unit duration field must not be null");
        }
        if (!unit->is_precise()) {
            return make_argument_error("Unit duration field must be precise");
        }
        if (unit->unit_millis() < 1) {
            return make_argument_error("The unit milliseconds must be at least 1");
        }
        return {};
    }

    PreciseDurationDateTimeField(FieldKind kind, std::shared_ptr<const DurationField> unit) noexcept
        : kind_(kind),
          unit_(std::move(unit)),
          unit_millis_(unit_->unit_millis()) {}

    /// Upper bound applied by set(); fields with a variable maximum may relax it
    virtual FieldResult<int32_t> max_value_for_set(int64_t instant, int32_t /*value*/) const {
        return max_value_at(instant);
    }

private:
    FieldKind kind_;
    std::shared_ptr<const DurationField> unit_;
    int64_t unit_millis_;
};

} // namespace calgebra
