#pragma once

#include "wirepack/error.hpp"
#include "wirepack/expected.hpp"
#include "wirepack/types.hpp"

#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include <cstddef>
#include <cstdint>

namespace wirepack {

// ============================================================================
// Layout kinds
// ============================================================================

/// Field declared without a layout (reported as missing_layout on pack/unpack)
struct NoLayout {
    constexpr bool operator==(const NoLayout&) const noexcept = default;
};

/// Unsigned integer of 8, 16, 32 or 64 bits
struct FixedWidthInteger {
    unsigned bits;
    constexpr bool operator==(const FixedWidthInteger&) const noexcept = default;
};

/// Byte string of exactly `length` bytes
struct FixedLengthBytes {
    std::size_t length;
    constexpr bool operator==(const FixedLengthBytes&) const noexcept = default;
};

/// Byte string consuming the rest of the buffer on unpack
struct VariableLengthBytes {
    constexpr bool operator==(const VariableLengthBytes&) const noexcept = default;
};

/// Member whose type declares its own schema
struct NestedRecord {
    constexpr bool operator==(const NestedRecord&) const noexcept = default;
};

/// Sub-byte field sharing byte-aligned storage with its neighbours
struct BitField {
    unsigned bits;
    unsigned offset; ///< Counted from bit 0 of the group's first byte
    constexpr bool operator==(const BitField&) const noexcept = default;
};

using LayoutKind = std::variant<NoLayout, FixedWidthInteger, FixedLengthBytes,
                                VariableLengthBytes, NestedRecord, BitField>;

/**
 * Layout declaration of one field: its kind plus the byte order of
 * multi-byte integers.
 */
struct FieldLayout {
    LayoutKind kind{};
    Endian endian{Endian::big};

    [[nodiscard]] constexpr bool is_bit_field() const noexcept {
        return std::holds_alternative<BitField>(kind);
    }

    [[nodiscard]] constexpr bool has_layout() const noexcept {
        return !std::holds_alternative<NoLayout>(kind);
    }

    constexpr bool operator==(const FieldLayout&) const noexcept = default;
};

// ============================================================================
// Layout factories
// ============================================================================

constexpr FieldLayout integer(unsigned bits, Endian endian = Endian::big) noexcept {
    return FieldLayout{FixedWidthInteger{bits}, endian};
}

constexpr FieldLayout fixed_bytes(std::size_t length) noexcept {
    return FieldLayout{FixedLengthBytes{length}, Endian::big};
}

constexpr FieldLayout variable_bytes() noexcept {
    return FieldLayout{VariableLengthBytes{}, Endian::big};
}

constexpr FieldLayout nested() noexcept {
    return FieldLayout{NestedRecord{}, Endian::big};
}

constexpr FieldLayout bits(unsigned width, unsigned offset = 0) noexcept {
    return FieldLayout{BitField{width, offset}, Endian::big};
}

/**
 * Parse a width token into a layout.
 *
 * Accepted tokens:
 *   "8", "16", "32", "64"   - integer of that many bits, byte order from `endian`
 *   "C"                     - 8-bit integer
 *   "n" / "v"               - 16-bit big / little endian
 *   "N" / "V"               - 32-bit big / little endian
 *   "J" / "P"               - 64-bit big / little endian
 *   "A<n>"                  - fixed-length byte string of n bytes
 *   "A*"                    - variable-length byte string
 *
 * Any other numeric token yields an integer layout of that bit count, and any
 * other text yields a zero-bit integer; both are reported as unsupported_width
 * when the field is packed or unpacked.
 */
inline FieldLayout parse_layout_token(std::string_view token,
                                      Endian endian = Endian::big) noexcept {
    if (token.size() == 1) {
        switch (token[0]) {
            case 'C':
                return integer(8);
            case 'n':
                return integer(16, Endian::big);
            case 'v':
                return integer(16, Endian::little);
            case 'N':
                return integer(32, Endian::big);
            case 'V':
                return integer(32, Endian::little);
            case 'J':
                return integer(64, Endian::big);
            case 'P':
                return integer(64, Endian::little);
            default:
                break;
        }
    }

    if (token.size() >= 2 && token[0] == 'A') {
        if (token == "A*") {
            return variable_bytes();
        }
        std::size_t length = 0;
        auto [ptr, ec] = std::from_chars(token.data() + 1, token.data() + token.size(), length);
        if (ec == std::errc{} && ptr == token.data() + token.size()) {
            return fixed_bytes(length);
        }
        return integer(0, endian);
    }

    unsigned bit_count = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), bit_count);
    if (!token.empty() && ec == std::errc{} && ptr == token.data() + token.size()) {
        return integer(bit_count, endian);
    }
    return integer(0, endian);
}

// ============================================================================
// Layout arithmetic
// ============================================================================

/**
 * Encoded form of a fixed-width integer: byte width and legacy format code.
 */
struct Encoding {
    std::size_t width; ///< Bytes on the wire
    char code;         ///< C, n, v, N, V, J or P

    constexpr bool operator==(const Encoding&) const noexcept = default;
};

/**
 * Byte width and format code of an integer field.
 *
 * @return Encoding, or ErrorCode::unsupported_width for widths other than 8/16/32/64
 */
constexpr expected<Encoding, ErrorCode> encoding_of(FixedWidthInteger field,
                                                    Endian endian) noexcept {
    const bool little = endian == Endian::little;
    switch (field.bits) {
        case 8:
            return Encoding{1, 'C'};
        case 16:
            return Encoding{2, little ? 'v' : 'n'};
        case 32:
            return Encoding{4, little ? 'V' : 'N'};
        case 64:
            return Encoding{8, little ? 'P' : 'J'};
        default:
            return unexpected(ErrorCode::unsupported_width);
    }
}

/**
 * Encoded byte width of a field.
 *
 * @param layout Field layout
 * @param runtime_length Length used for variable-length byte strings and nested
 *        records: the value (or packed nested record) length on pack, the remaining
 *        buffer length on unpack
 * @return Width in bytes; for a bit-field, the bytes of its group needed to reach
 *         its highest bit
 */
constexpr expected<std::size_t, ErrorCode> width_of(const FieldLayout& layout,
                                                    std::size_t runtime_length = 0) noexcept {
    return std::visit(
        [&](const auto& kind) -> expected<std::size_t, ErrorCode> {
            using K = std::decay_t<decltype(kind)>;
            if constexpr (std::is_same_v<K, NoLayout>) {
                return unexpected(ErrorCode::missing_layout);
            } else if constexpr (std::is_same_v<K, FixedWidthInteger>) {
                auto encoding = encoding_of(kind, layout.endian);
                if (!encoding) {
                    return unexpected(encoding.error());
                }
                return encoding->width;
            } else if constexpr (std::is_same_v<K, FixedLengthBytes>) {
                return kind.length;
            } else if constexpr (std::is_same_v<K, BitField>) {
                if (kind.bits == 0 || kind.bits > 64 || kind.offset >= 64 ||
                    kind.offset + kind.bits > 64) {
                    return unexpected(ErrorCode::unsupported_width);
                }
                return (kind.offset + kind.bits + 7) / 8;
            } else {
                return runtime_length;
            }
        },
        layout.kind);
}

/**
 * Legacy format code of a layout ("C", "n", "A6", "A*", "b4@0", ...).
 *
 * Intended for diagnostics; unsupported integer widths render as "?<bits>".
 */
inline std::string layout_code(const FieldLayout& layout) {
    return std::visit(
        [&](const auto& kind) -> std::string {
            using K = std::decay_t<decltype(kind)>;
            if constexpr (std::is_same_v<K, NoLayout>) {
                return "-";
            } else if constexpr (std::is_same_v<K, FixedWidthInteger>) {
                auto encoding = encoding_of(kind, layout.endian);
                if (!encoding) {
                    return "?" + std::to_string(kind.bits);
                }
                return std::string(1, encoding->code);
            } else if constexpr (std::is_same_v<K, FixedLengthBytes>) {
                return "A" + std::to_string(kind.length);
            } else if constexpr (std::is_same_v<K, VariableLengthBytes>) {
                return "A*";
            } else if constexpr (std::is_same_v<K, NestedRecord>) {
                return "record";
            } else {
                return "b" + std::to_string(kind.bits) + "@" + std::to_string(kind.offset);
            }
        },
        layout.kind);
}

} // namespace wirepack
