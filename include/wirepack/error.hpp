#pragma once

#include "wirepack/expected.hpp"
#include "wirepack/types.hpp"

#include <optional>
#include <string>
#include <utility>

#include <cstddef>
#include <cstdint>

namespace wirepack {

/**
 * @brief Error codes reported by pack and unpack
 *
 * Every code is fatal to the call that produced it; the codec never retries.
 */
enum class ErrorCode : uint8_t {
    missing_layout,         ///< Field declared without any layout
    unsupported_width,      ///< Integer or bit-field width the codec cannot encode
    buffer_overflow,        ///< Input exceeds the configured maximum, or too few bytes remain
    nesting_depth_exceeded, ///< Nested records deeper than the configured maximum
    validation_failed,      ///< Decoded value violates a declared constraint
    overlapping_bit_fields, ///< Two fields of one bit-field group share bits
    length_mismatch         ///< Fixed-length byte string value has the wrong length
};

constexpr const char* error_code_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::missing_layout:
            return "Missing layout declaration";
        case ErrorCode::unsupported_width:
            return "Unsupported field width";
        case ErrorCode::buffer_overflow:
            return "Buffer overflow";
        case ErrorCode::nesting_depth_exceeded:
            return "Maximum nesting depth exceeded";
        case ErrorCode::validation_failed:
            return "Validation failed";
        case ErrorCode::overlapping_bit_fields:
            return "Overlapping bit-fields";
        case ErrorCode::length_mismatch:
            return "Fixed-length value has wrong length";
        default:
            return "Unknown error";
    }
}

/**
 * @brief Error information from a failed pack or unpack
 *
 * Carries enough context to be logged without re-deriving codec state:
 * the offending field, the attempted size/depth/width and the limit it broke.
 *
 * Meaning of attempted/limit per code:
 * - buffer_overflow: bytes required (or supplied) vs bytes available (or allowed)
 * - nesting_depth_exceeded: depth reached vs max_nesting_depth
 * - unsupported_width: declared bits (and bit offset in limit for bit-fields)
 * - length_mismatch: value length vs declared length
 * - overlapping_bit_fields: offset and width of the rejected field
 */
struct MarshalError {
    ErrorCode code;
    std::string field{};     ///< Field name, empty for record-level errors
    std::size_t attempted{0};
    std::size_t limit{0};
    std::optional<ConstraintKind> constraint{}; ///< Set for validation_failed
    std::string detail{};    ///< Constraint description or custom validation message
    bool custom_message{false};

    /**
     * @brief Get a human-readable error message
     */
    [[nodiscard]] std::string message() const {
        if (code == ErrorCode::validation_failed && custom_message) {
            return detail;
        }

        std::string text = error_code_string(code);
        switch (code) {
            case ErrorCode::missing_layout:
                text += ": field '" + field + "' has no layout";
                break;
            case ErrorCode::unsupported_width:
                text += ": field '" + field + "' declares " + std::to_string(attempted) + " bits";
                break;
            case ErrorCode::buffer_overflow:
                text += ": requested " + std::to_string(attempted) +
                        " bytes exceeds available " + std::to_string(limit) + " bytes";
                if (!field.empty()) {
                    text += " (field '" + field + "')";
                }
                break;
            case ErrorCode::nesting_depth_exceeded:
                text += ": depth " + std::to_string(attempted) + " > limit " +
                        std::to_string(limit);
                if (!field.empty()) {
                    text += " (field '" + field + "')";
                }
                break;
            case ErrorCode::validation_failed:
                text += " for field '" + field + "'";
                if (constraint) {
                    text += std::string(" [") + constraint_kind_string(*constraint) + "]";
                }
                if (!detail.empty()) {
                    text += ": " + detail;
                }
                break;
            case ErrorCode::overlapping_bit_fields:
                text += ": field '" + field + "' at bit offset " + std::to_string(limit) +
                        " (" + std::to_string(attempted) + " bits) overlaps an earlier field";
                break;
            case ErrorCode::length_mismatch:
                text += ": field '" + field + "' holds " + std::to_string(attempted) +
                        " bytes, declared " + std::to_string(limit);
                break;
        }
        return text;
    }
};

/**
 * @brief Result type for pack and unpack operations
 *
 * Alias for expected<T, MarshalError>.
 *
 * Usage:
 * @code
 *   auto result = wirepack::unpack<IcmpPacket>(buffer);
 *   if (!result) {
 *       std::cerr << result.error().message() << "\n";
 *   }
 * @endcode
 */
template <typename T>
using MarshalResult = expected<T, MarshalError>;

/**
 * @brief Factory for unexpected<MarshalError> values
 *
 * @code
 *   return make_marshal_error(ErrorCode::buffer_overflow, field.name, needed, bytes.size());
 * @endcode
 */
inline auto make_marshal_error(ErrorCode code, std::string field, std::size_t attempted = 0,
                               std::size_t limit = 0) {
    return unexpected(MarshalError{
        .code = code, .field = std::move(field), .attempted = attempted, .limit = limit});
}

} // namespace wirepack
