#pragma once

#include "calgebra/date_time_field.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace calgebra {

/**
 * @brief Sentinel for a field a calendar system does not provide
 *
 * Reports its kind and name and is never lenient. add() and the difference
 * operations still work through the duration field, so a chronology can
 * support "add 3 weeks" without a week-of-weekyear field. Every other
 * operation fails with unsupported_operation.
 *
 * Instances are cached per (kind, duration field) for the lifetime of the
 * process.
 */
class UnsupportedDateTimeField final : public DateTimeField {
public:
    using FieldPtr = std::shared_ptr<const UnsupportedDateTimeField>;

    /**
     * @brief Shared sentinel for kind over duration
     *
     * Repeated calls with the same kind and the same duration field instance
     * return the same sentinel.
     */
    [[nodiscard]] static FieldResult<FieldPtr> instance(FieldKind kind,
                                                        std::shared_ptr<const DurationField> duration) {
        if (!duration) {
            return make_argument_error("The duration field must not be null");
        }

        static std::mutex cache_mutex;
        static std::map<std::pair<FieldKind, const DurationField*>, FieldPtr> cache;

        std::lock_guard<std::mutex> lock(cache_mutex);
        auto& slot = cache[{kind, duration.get()}];
        if (!slot) {
            slot = std::make_shared<UnsupportedDateTimeField>(construct_tag{}, kind,
                                                              std::move(duration));
        }
        return slot;
    }

    [[nodiscard]] FieldKind type() const noexcept override { return kind_; }
    [[nodiscard]] bool is_supported() const noexcept override { return false; }
    [[nodiscard]] bool is_lenient() const noexcept override { return false; }

    [[nodiscard]] FieldResult<int32_t> get(int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> set(int64_t /*instant*/, int32_t /*value*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> add(int64_t instant, int64_t amount) const override {
        return duration_->add(instant, amount);
    }

    [[nodiscard]] FieldResult<int64_t> add_wrap_field(int64_t /*instant*/,
                                                      int32_t /*amount*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<void> add_partial(const Partial& /*partial*/, size_t /*index*/,
                                                std::span<int32_t> /*values*/,
                                                int32_t /*amount*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<void> add_wrap_partial(const Partial& /*partial*/, size_t /*index*/,
                                                     std::span<int32_t> /*values*/,
                                                     int32_t /*amount*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<void> add_wrap_field_partial(const Partial& /*partial*/,
                                                           size_t /*index*/,
                                                           std::span<int32_t> /*values*/,
                                                           int32_t /*amount*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<void> set_partial(const Partial& /*partial*/, size_t /*index*/,
                                                std::span<int32_t> /*values*/,
                                                int32_t /*value*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int32_t> difference(int64_t minuend_instant,
                                                  int64_t subtrahend_instant) const override {
        return duration_->difference(minuend_instant, subtrahend_instant);
    }

    [[nodiscard]] FieldResult<int64_t>
    difference_as_long(int64_t minuend_instant, int64_t subtrahend_instant) const override {
        return duration_->difference_as_long(minuend_instant, subtrahend_instant);
    }

    [[nodiscard]] std::shared_ptr<const DurationField> duration_field() const override {
        return duration_;
    }

    [[nodiscard]] std::shared_ptr<const DurationField> range_duration_field() const override {
        return nullptr;
    }

    [[nodiscard]] FieldResult<bool> is_leap(int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int32_t> leap_amount(int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int32_t> min_value() const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int32_t> min_value_at(int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int32_t> min_value_in(const Partial& /*partial*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int32_t>
    min_value_for(const Partial& /*partial*/, std::span<const int32_t> /*values*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int32_t> max_value() const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int32_t> max_value_at(int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int32_t> max_value_in(const Partial& /*partial*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int32_t>
    max_value_for(const Partial& /*partial*/, std::span<const int32_t> /*values*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> round_floor(int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> round_ceiling(int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> round_half_floor(int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> round_half_ceiling(int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> round_half_even(int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> remainder(int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    UnsupportedDateTimeField(construct_tag, FieldKind kind,
                             std::shared_ptr<const DurationField> duration) noexcept
        : kind_(kind),
          duration_(std::move(duration)) {}

private:
    FieldKind kind_;
    std::shared_ptr<const DurationField> duration_;
};

} // namespace calgebra
