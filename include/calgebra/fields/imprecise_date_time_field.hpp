#pragma once

#include "calgebra/date_time_field.hpp"

#include <memory>

namespace calgebra {

/**
 * @brief Base for fields whose unit varies in length (months, years)
 *
 * The subclass supplies get(), set(), add() and round_floor() with real
 * calendar arithmetic. This base supplies the unit duration field, which
 * routes every instant-relative operation back into the subclass, and a
 * difference that starts from an estimate based on the average unit length
 * and corrects it with add() until it neither overshoots nor falls short.
 *
 * The duration field shares ownership with the field through an aliasing
 * std::shared_ptr, so instances must be owned by a std::shared_ptr for
 * duration_field() to be non-null.
 */
class ImpreciseDateTimeField : public DateTimeField,
                               public std::enable_shared_from_this<ImpreciseDateTimeField> {
public:
    [[nodiscard]] FieldKind type() const noexcept override { return kind_; }

    [[nodiscard]] FieldResult<int64_t> add(int64_t instant, int64_t amount) const override = 0;

    [[nodiscard]] FieldResult<int32_t> difference(int64_t minuend_instant,
                                                  int64_t subtrahend_instant) const override {
        return difference_as_long(minuend_instant, subtrahend_instant).and_then(safe_to_int);
    }

    [[nodiscard]] FieldResult<int64_t>
    difference_as_long(int64_t minuend_instant, int64_t subtrahend_instant) const override {
        if (minuend_instant < subtrahend_instant) {
            return difference_as_long(subtrahend_instant, minuend_instant).and_then(safe_negate);
        }

        auto span = safe_subtract(minuend_instant, subtrahend_instant);
        if (!span) {
            return span;
        }
        int64_t difference = *span / unit_millis_;

        auto moved = add(subtrahend_instant, difference);
        if (!moved) {
            return moved;
        }
        if (*moved < minuend_instant) {
            do {
                ++difference;
                moved = add(subtrahend_instant, difference);
                if (!moved) {
                    return moved;
                }
            } while (*moved <= minuend_instant);
            --difference;
        } else if (*moved > minuend_instant) {
            do {
                --difference;
                moved = add(subtrahend_instant, difference);
                if (!moved) {
                    return moved;
                }
            } while (*moved > minuend_instant);
        }
        return difference;
    }

    [[nodiscard]] std::shared_ptr<const DurationField> duration_field() const override {
        auto self = weak_from_this().lock();
        if (!self) {
            return nullptr;
        }
        return std::shared_ptr<const DurationField>(self, &linked_);
    }

protected:
    /**
     * @param kind Field kind reported by type()
     * @param unit_millis Average length of one unit in milliseconds
     */
    ImpreciseDateTimeField(FieldKind kind, int64_t unit_millis) noexcept
        : kind_(kind),
          unit_millis_(unit_millis),
          linked_(*this, unit_kind(kind)) {}

    [[nodiscard]] int64_t duration_unit_millis() const noexcept { return unit_millis_; }

private:
    /// Imprecise duration field answered by the owning date-time field
    class LinkedDurationField final : public DurationField {
    public:
        LinkedDurationField(const ImpreciseDateTimeField& owner, DurationKind kind) noexcept
            : owner_(owner),
              kind_(kind) {}

        [[nodiscard]] DurationKind type() const noexcept override { return kind_; }
        [[nodiscard]] bool is_precise() const noexcept override { return false; }
        [[nodiscard]] int64_t unit_millis() const noexcept override {
            return owner_.unit_millis_;
        }

        [[nodiscard]] FieldResult<int64_t> value_as_long_at(int64_t duration,
                                                            int64_t instant) const override {
            return safe_add(instant, duration).and_then([this, instant](int64_t end) {
                return owner_.difference_as_long(end, instant);
            });
        }

        [[nodiscard]] FieldResult<int64_t> millis_at(int64_t value,
                                                     int64_t instant) const override {
            return owner_.add(instant, value).and_then(
                [instant](int64_t end) { return safe_subtract(end, instant); });
        }

        [[nodiscard]] FieldResult<int64_t> add(int64_t instant, int64_t value) const override {
            return owner_.add(instant, value);
        }

        [[nodiscard]] FieldResult<int64_t>
        difference_as_long(int64_t minuend_instant, int64_t subtrahend_instant) const override {
            return owner_.difference_as_long(minuend_instant, subtrahend_instant);
        }

    private:
        const ImpreciseDateTimeField& owner_;
        DurationKind kind_;
    };

    FieldKind kind_;
    int64_t unit_millis_;
    LinkedDurationField linked_;
};

} // namespace calgebra
