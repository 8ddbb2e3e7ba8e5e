#pragma once

#include "calgebra/fields/precise_duration_date_time_field.hpp"

#include <memory>
#include <string>
#include <utility>

namespace calgebra {

/**
 * @brief Field cycling through a fixed number of precise units
 *
 * Both the unit and the range have fixed lengths, e.g. minute-of-hour (unit
 * minutes, range hours, values 0..59). Values are counted from the epoch, so
 * no calendar knowledge is needed.
 */
class PreciseDateTimeField final : public PreciseDurationDateTimeField {
public:
    /**
     * @param kind Field kind reported by type()
     * @param unit Precise unit duration field (at least 1 ms)
     * @param range Precise range duration field, at least two units long
     */
    [[nodiscard]] static FieldResult<std::shared_ptr<const PreciseDateTimeField>>
    create(FieldKind kind, std::shared_ptr<const DurationField> unit,
           std::shared_ptr<const DurationField> range) {
        if (auto valid = check_unit(unit); !valid) {
            return unexpected(valid.error());
        }
        if (!range) {
            return make_argument_error("The range duration field must not be null");
        }
        if (!range->is_precise()) {
            return make_argument_error("Range duration field must be precise");
        }
        int64_t effective_range = range->unit_millis() / unit->unit_millis();
        if (effective_range < 2) {
            return make_argument_error("The effective range must be at least 2: " +
                                       std::to_string(effective_range));
        }
        auto units = safe_to_int(effective_range);
        if (!units) {
            return unexpected(units.error());
        }
        return std::shared_ptr<const PreciseDateTimeField>(std::make_shared<PreciseDateTimeField>(
            construct_tag{}, kind, std::move(unit), std::move(range), *units));
    }

    [[nodiscard]] FieldResult<int32_t> get(int64_t instant) const override {
        if (instant >= 0) {
            return static_cast<int32_t>((instant / unit_millis()) % range_);
        }
        return static_cast<int32_t>(range_ - 1 + ((instant + 1) / unit_millis()) % range_);
    }

    [[nodiscard]] FieldResult<int64_t> add_wrap_field(int64_t instant,
                                                      int32_t amount) const override {
        auto current = get(instant);
        if (!current) {
            return unexpected(current.error());
        }
        auto wrapped = get_wrapped_value(*current, amount, 0, range_ - 1);
        if (!wrapped) {
            return unexpected(wrapped.error());
        }
        // |wrapped - current| < range, so only the final addition can overflow
        return safe_add(instant, (static_cast<int64_t>(*wrapped) - *current) * unit_millis());
    }

    [[nodiscard]] FieldResult<int64_t> set(int64_t instant, int32_t value) const override {
        if (auto valid = verify_value_bounds(type(), value, 0, range_ - 1); !valid) {
            return unexpected(valid.error());
        }
        auto current = get(instant);
        if (!current) {
            return unexpected(current.error());
        }
        return safe_add(instant, (static_cast<int64_t>(value) - *current) * unit_millis());
    }

    [[nodiscard]] std::shared_ptr<const DurationField> range_duration_field() const override {
        return range_field_;
    }

    [[nodiscard]] FieldResult<int32_t> max_value() const override { return range_ - 1; }

    /// Number of units in one range
    [[nodiscard]] int32_t range() const noexcept { return range_; }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    PreciseDateTimeField(construct_tag, FieldKind kind, std::shared_ptr<const DurationField> unit,
                         std::shared_ptr<const DurationField> range, int32_t units) noexcept
        : PreciseDurationDateTimeField(kind, std::move(unit)),
          range_field_(std::move(range)),
          range_(units) {}

private:
    std::shared_ptr<const DurationField> range_field_;
    int32_t range_;
};

} // namespace calgebra
