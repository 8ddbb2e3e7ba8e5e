#pragma once

#include "calgebra/duration_field.hpp"

#include <memory>

namespace calgebra {

/**
 * @brief The millisecond duration field (unit of 1 ms)
 *
 * Every conversion is the identity; only add and difference can overflow.
 */
class MillisDurationField final : public DurationField {
public:
    /// Process-wide shared instance
    [[nodiscard]] static const std::shared_ptr<const MillisDurationField>& instance() {
        static const std::shared_ptr<const MillisDurationField> field =
            std::make_shared<MillisDurationField>(construct_tag{});
        return field;
    }

    [[nodiscard]] DurationKind type() const noexcept override { return DurationKind::millis; }
    [[nodiscard]] bool is_precise() const noexcept override { return true; }
    [[nodiscard]] int64_t unit_millis() const noexcept override { return 1; }

    [[nodiscard]] FieldResult<int32_t> value(int64_t duration) const override {
        return safe_to_int(duration);
    }

    [[nodiscard]] FieldResult<int64_t> value_as_long(int64_t duration) const override {
        return duration;
    }

    [[nodiscard]] FieldResult<int64_t> value_as_long_at(int64_t duration,
                                                        int64_t /*instant*/) const override {
        return duration;
    }

    [[nodiscard]] FieldResult<int64_t> millis(int64_t value) const override { return value; }

    [[nodiscard]] FieldResult<int64_t> millis_at(int64_t value,
                                                 int64_t /*instant*/) const override {
        return value;
    }

    [[nodiscard]] FieldResult<int64_t> add(int64_t instant, int64_t value) const override {
        return safe_add(instant, value);
    }

    [[nodiscard]] FieldResult<int64_t>
    difference_as_long(int64_t minuend_instant, int64_t subtrahend_instant) const override {
        return safe_subtract(minuend_instant, subtrahend_instant);
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    explicit MillisDurationField(construct_tag) noexcept {}
};

} // namespace calgebra
