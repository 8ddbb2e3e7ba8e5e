#pragma once

#include "calgebra/duration_field.hpp"

#include <compare>
#include <map>
#include <memory>
#include <mutex>

namespace calgebra {

/**
 * @brief Sentinel for a duration unit a calendar system does not provide
 *
 * Reports itself as precise with a unit of 0 ms and compares equal to every
 * other duration field, so it sorts neutrally. All conversions and arithmetic
 * fail with unsupported_operation.
 *
 * Instances are cached per kind for the lifetime of the process.
 */
class UnsupportedDurationField final : public DurationField {
public:
    /// Shared sentinel for kind; repeated calls return the same instance
    [[nodiscard]] static std::shared_ptr<const UnsupportedDurationField> instance(DurationKind kind) {
        static std::mutex cache_mutex;
        static std::map<DurationKind, std::shared_ptr<const UnsupportedDurationField>> cache;

        std::lock_guard<std::mutex> lock(cache_mutex);
        auto& slot = cache[kind];
        if (!slot) {
            slot = std::make_shared<UnsupportedDurationField>(construct_tag{}, kind);
        }
        return slot;
    }

    [[nodiscard]] DurationKind type() const noexcept override { return kind_; }
    [[nodiscard]] bool is_supported() const noexcept override { return false; }
    [[nodiscard]] bool is_precise() const noexcept override { return true; }
    [[nodiscard]] int64_t unit_millis() const noexcept override { return 0; }

    [[nodiscard]] FieldResult<int32_t> value(int64_t /*duration*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> value_as_long(int64_t /*duration*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int32_t> value_at(int64_t /*duration*/,
                                                int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> value_as_long_at(int64_t /*duration*/,
                                                        int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> millis(int64_t /*value*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> millis_at(int64_t /*value*/,
                                                 int64_t /*instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t> add(int64_t /*instant*/, int64_t /*value*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int32_t> difference(int64_t /*minuend_instant*/,
                                                  int64_t /*subtrahend_instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] FieldResult<int64_t>
    difference_as_long(int64_t /*minuend_instant*/,
                       int64_t /*subtrahend_instant*/) const override {
        return make_unsupported_error(kind_);
    }

    [[nodiscard]] std::strong_ordering
    compare(const DurationField& /*other*/) const noexcept override {
        return std::strong_ordering::equal;
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    UnsupportedDurationField(construct_tag, DurationKind kind) noexcept : kind_(kind) {}

private:
    DurationKind kind_;
};

} // namespace calgebra
