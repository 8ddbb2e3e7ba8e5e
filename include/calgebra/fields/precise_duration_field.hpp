#pragma once

#include "calgebra/duration_field.hpp"

#include <memory>
#include <string>

namespace calgebra {

/**
 * @brief Duration field with a fixed number of milliseconds per unit
 *
 * Used for days, hours, minutes, seconds and any other unit that never
 * varies in length on the millisecond axis.
 */
class PreciseDurationField final : public DurationField {
public:
    /**
     * @param kind Duration kind reported by type()
     * @param unit_millis Milliseconds per unit, at least 1
     */
    [[nodiscard]] static FieldResult<std::shared_ptr<const PreciseDurationField>>
    create(DurationKind kind, int64_t unit_millis) {
        if (unit_millis < 1) {
            return make_argument_error("Unit milliseconds must be at least 1: " +
                                       std::to_string(unit_millis));
        }
        return std::shared_ptr<const PreciseDurationField>(
            std::make_shared<PreciseDurationField>(construct_tag{}, kind, unit_millis));
    }

    [[nodiscard]] DurationKind type() const noexcept override { return kind_; }
    [[nodiscard]] bool is_precise() const noexcept override { return true; }
    [[nodiscard]] int64_t unit_millis() const noexcept override { return unit_; }

    [[nodiscard]] FieldResult<int64_t> value_as_long_at(int64_t duration,
                                                        int64_t /*instant*/) const override {
        return duration / unit_;
    }

    [[nodiscard]] FieldResult<int64_t> millis_at(int64_t value,
                                                 int64_t /*instant*/) const override {
        return safe_multiply(value, unit_);
    }

    [[nodiscard]] FieldResult<int64_t> add(int64_t instant, int64_t value) const override {
        return safe_multiply(value, unit_).and_then(
            [instant](int64_t addition) { return safe_add(instant, addition); });
    }

    [[nodiscard]] FieldResult<int64_t>
    difference_as_long(int64_t minuend_instant, int64_t subtrahend_instant) const override {
        return safe_subtract(minuend_instant, subtrahend_instant)
            .map([this](int64_t difference) { return difference / unit_; });
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    PreciseDurationField(construct_tag, DurationKind kind, int64_t unit_millis) noexcept
        : kind_(kind),
          unit_(unit_millis) {}

private:
    DurationKind kind_;
    int64_t unit_;
};

} // namespace calgebra
