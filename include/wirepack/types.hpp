#pragma once

#include <compare>
#include <string>

#include <cstdint>

namespace wirepack {

/**
 * Byte order of a multi-byte integer field on the wire.
 *
 * Irrelevant for 1-byte integers, byte strings and bit-field groups
 * (bit-field groups are always stored least-significant byte first).
 */
enum class Endian : uint8_t {
    big,   ///< Network byte order (default)
    little ///< Least-significant byte first
};

/**
 * Comparison operator used by conditional field guards.
 */
enum class CompareOp : uint8_t {
    eq, ///< ==
    ne, ///< !=
    lt, ///< <
    gt, ///< >
    le, ///< <=
    ge  ///< >=
};

/**
 * Value category of a record member, as seen by the codec.
 */
enum class ValueCategory : uint8_t {
    integer, ///< Integral, bool or enum member
    bytes,   ///< std::string or std::vector<uint8_t> member
    record   ///< Member whose type declares its own schema
};

/**
 * Kind of a post-unpack validation constraint.
 */
enum class ConstraintKind : uint8_t {
    min,     ///< Integer value must be >= bound
    max,     ///< Integer value must be <= bound
    in,      ///< Integer value must be one of a set
    not_in,  ///< Integer value must not be one of a set
    pattern  ///< Byte string must match a regular expression
};

/**
 * Integer field value as read from a record member.
 *
 * Signed members are stored two's complement in `raw`; comparisons against
 * signed literals honour the member's signedness.
 */
struct IntegerValue {
    uint64_t raw{0};
    bool is_signed{false};

    [[nodiscard]] constexpr std::strong_ordering compare(int64_t literal) const noexcept {
        if (is_signed) {
            return static_cast<int64_t>(raw) <=> literal;
        }
        if (literal < 0) {
            return std::strong_ordering::greater;
        }
        return raw <=> static_cast<uint64_t>(literal);
    }

    [[nodiscard]] std::string to_string() const {
        return is_signed ? std::to_string(static_cast<int64_t>(raw)) : std::to_string(raw);
    }
};

constexpr const char* endian_string(Endian endian) noexcept {
    switch (endian) {
        case Endian::big:
            return "big";
        case Endian::little:
            return "little";
        default:
            return "unknown";
    }
}

constexpr const char* compare_op_string(CompareOp op) noexcept {
    switch (op) {
        case CompareOp::eq:
            return "==";
        case CompareOp::ne:
            return "!=";
        case CompareOp::lt:
            return "<";
        case CompareOp::gt:
            return ">";
        case CompareOp::le:
            return "<=";
        case CompareOp::ge:
            return ">=";
        default:
            return "?";
    }
}

constexpr const char* value_category_string(ValueCategory category) noexcept {
    switch (category) {
        case ValueCategory::integer:
            return "integer";
        case ValueCategory::bytes:
            return "bytes";
        case ValueCategory::record:
            return "record";
        default:
            return "unknown";
    }
}

constexpr const char* constraint_kind_string(ConstraintKind kind) noexcept {
    switch (kind) {
        case ConstraintKind::min:
            return "min";
        case ConstraintKind::max:
            return "max";
        case ConstraintKind::in:
            return "in";
        case ConstraintKind::not_in:
            return "not_in";
        case ConstraintKind::pattern:
            return "pattern";
        default:
            return "unknown";
    }
}

} // namespace wirepack
