#pragma once

#include "calgebra/expected.hpp"
#include "calgebra/field_kind.hpp"

#include <optional>
#include <string>
#include <utility>

#include <cstdint>

namespace calgebra {

/**
 * @brief Failure categories reported by field operations
 */
enum class FieldErrorCode : uint8_t {
    invalid_field_value,           ///< Value outside the field's computed bounds
    arithmetic_overflow,           ///< Result not representable in the target integer type
    unsupported_operation,         ///< Operation invoked on an unsupported sentinel field
    incompatible_fields_for_carry, ///< Partial carry into a mismatched or missing larger field
    invalid_argument               ///< Structurally invalid factory or helper argument
};

[[nodiscard]] constexpr const char* field_error_string(FieldErrorCode code) noexcept {
    switch (code) {
        case FieldErrorCode::invalid_field_value:
            return "Illegal field value";
        case FieldErrorCode::arithmetic_overflow:
            return "Arithmetic overflow";
        case FieldErrorCode::unsupported_operation:
            return "Unsupported operation";
        case FieldErrorCode::incompatible_fields_for_carry:
            return "Fields incompatible for carry";
        case FieldErrorCode::invalid_argument:
            return "Invalid argument";
    }
    return "Unknown field error";
}

/**
 * @brief Error information from a failed field operation
 *
 * Carries the field the error relates to (a date-time field kind, a duration
 * kind, or neither for bare arithmetic), the offending value and the bounds
 * that were attempted, plus free-form detail text.
 */
struct FieldError {
    FieldErrorCode code;                      ///< Error category
    std::optional<FieldKind> field{};         ///< Date-time field involved, if any
    std::optional<DurationKind> duration{};   ///< Duration field involved, if any
    std::optional<int64_t> value{};           ///< Offending value
    std::optional<int64_t> lower_bound{};     ///< Lower bound attempted
    std::optional<int64_t> upper_bound{};     ///< Upper bound attempted
    std::string detail{};                     ///< Extra context (operands, reason)

    /**
     * @brief Get a short description of the error category
     * @return Static string describing the error code
     */
    [[nodiscard]] const char* message() const noexcept { return field_error_string(code); }

    /**
     * @brief Build the full human-readable description
     *
     * Field value errors follow the form
     * "Value 13 for monthOfYear must be in the range [1,12]".
     */
    [[nodiscard]] std::string describe() const {
        if (code == FieldErrorCode::invalid_field_value && value) {
            std::string text = "Value " + std::to_string(*value) + " for " + subject_name() + ' ';
            if (!lower_bound && !upper_bound) {
                text += "is not supported";
            } else if (!lower_bound) {
                text += "must not be larger than " + std::to_string(*upper_bound);
            } else if (!upper_bound) {
                text += "must not be smaller than " + std::to_string(*lower_bound);
            } else {
                text += "must be in the range [" + std::to_string(*lower_bound) + ',' +
                        std::to_string(*upper_bound) + ']';
            }
            if (!detail.empty()) {
                text += ": " + detail;
            }
            return text;
        }

        std::string text = message();
        std::string subject = subject_name();
        if (!subject.empty()) {
            text += " [" + subject + ']';
        }
        if (!detail.empty()) {
            text += ": " + detail;
        }
        return text;
    }

private:
    [[nodiscard]] std::string subject_name() const {
        if (field) {
            return std::string(field_kind_name(*field));
        }
        if (duration) {
            return std::string(duration_kind_name(*duration));
        }
        return {};
    }
};

/**
 * @brief Result type for field operations
 *
 * Alias for expected<T, FieldError>. Holds either the computed value or a
 * FieldError describing why the operation was rejected.
 *
 * @tparam T The type of the successfully computed value
 */
template <typename T>
using FieldResult = expected<T, FieldError>;

/**
 * @brief Create an error for a value outside [lower, upper]
 *
 * Passing nullopt for both bounds yields the "is not supported" form used for
 * values that are excluded outright (a skipped year zero).
 */
inline auto make_value_error(FieldKind field, int64_t value, std::optional<int64_t> lower,
                             std::optional<int64_t> upper) {
    return unexpected(FieldError{.code = FieldErrorCode::invalid_field_value,
                                 .field = field,
                                 .value = value,
                                 .lower_bound = lower,
                                 .upper_bound = upper});
}

inline auto make_overflow_error(std::string detail) {
    return unexpected(
        FieldError{.code = FieldErrorCode::arithmetic_overflow, .detail = std::move(detail)});
}

inline auto make_argument_error(std::string detail) {
    return unexpected(
        FieldError{.code = FieldErrorCode::invalid_argument, .detail = std::move(detail)});
}

inline auto make_unsupported_error(FieldKind field) {
    return unexpected(FieldError{.code = FieldErrorCode::unsupported_operation,
                                 .field = field,
                                 .detail = std::string(field_kind_name(field)) +
                                           " field is unsupported"});
}

inline auto make_unsupported_error(DurationKind duration) {
    return unexpected(FieldError{.code = FieldErrorCode::unsupported_operation,
                                 .duration = duration,
                                 .detail = std::string(duration_kind_name(duration)) +
                                           " field is unsupported"});
}

inline auto make_carry_error(FieldKind field, std::string detail) {
    return unexpected(FieldError{.code = FieldErrorCode::incompatible_fields_for_carry,
                                 .field = field,
                                 .detail = std::move(detail)});
}

} // namespace calgebra
