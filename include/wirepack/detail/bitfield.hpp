#pragma once

#include "wirepack/error.hpp"
#include "wirepack/expected.hpp"
#include "wirepack/layout.hpp"

#include <span>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace wirepack::detail {

// Helper to calculate mask safely without UB shift
constexpr uint64_t calculate_mask(unsigned width) noexcept {
    if (width >= 64) {
        // Full-width field - all bits set
        return ~uint64_t{0};
    }
    return (uint64_t{1} << width) - 1;
}

// Width 1..64 and the field must end inside the 64-bit accumulator
constexpr bool is_supported(BitField field) noexcept {
    return field.bits > 0 && field.bits <= 64 && field.offset < 64 &&
           field.offset + field.bits <= 64;
}

// Bits of the group occupied by this field
constexpr uint64_t placement_mask(BitField field) noexcept {
    return calculate_mask(field.bits) << field.offset;
}

// Extract field value from group storage
constexpr uint64_t extract(uint64_t word, BitField field) noexcept {
    return (word >> field.offset) & calculate_mask(field.bits);
}

// Insert field value into group storage (excess value bits are dropped)
constexpr uint64_t insert(uint64_t word, BitField field, uint64_t value) noexcept {
    return word | ((value & calculate_mask(field.bits)) << field.offset);
}

inline MarshalError bit_field_error(ErrorCode code, BitField field) {
    return MarshalError{.code = code, .attempted = field.bits, .limit = field.offset};
}

/**
 * Accumulates one bit-field group for packing.
 *
 * Fields are ORed into a 64-bit accumulator at their offsets; flush() emits
 * ceil(max_bits_used / 8) bytes least-significant byte first and resets the
 * group. Offsets that overlap an earlier field of the same group are rejected.
 */
class BitFieldPacker {
public:
    [[nodiscard]] expected<void, MarshalError> add(BitField field, uint64_t value) {
        if (!is_supported(field)) {
            return unexpected(bit_field_error(ErrorCode::unsupported_width, field));
        }
        if ((used_ & placement_mask(field)) != 0) {
            return unexpected(bit_field_error(ErrorCode::overlapping_bit_fields, field));
        }

        accumulator_ = insert(accumulator_, field, value);
        used_ |= placement_mask(field);
        if (field.offset + field.bits > max_bits_used_) {
            max_bits_used_ = field.offset + field.bits;
        }
        open_ = true;
        return {};
    }

    [[nodiscard]] bool is_open() const noexcept { return open_; }

    /**
     * Emit the open group and reset.
     * @return Number of bytes appended (0 if no group was open)
     */
    std::size_t flush(std::vector<uint8_t>& out) {
        if (!open_) {
            return 0;
        }
        const std::size_t byte_count = (max_bits_used_ + 7) / 8;
        for (std::size_t i = 0; i < byte_count; ++i) {
            out.push_back(static_cast<uint8_t>(accumulator_ >> (8 * i)));
        }
        reset();
        return byte_count;
    }

    void reset() noexcept {
        accumulator_ = 0;
        used_ = 0;
        max_bits_used_ = 0;
        open_ = false;
    }

private:
    uint64_t accumulator_{0};
    uint64_t used_{0};
    unsigned max_bits_used_{0};
    bool open_{false};
};

/**
 * Extracts the fields of one bit-field group during unpacking.
 *
 * Bytes are pulled from the input lazily, least-significant byte first, only as
 * far as the current field reaches; later fields of the same group reuse bytes
 * already read. reset() must be called when the group ends.
 */
class BitFieldUnpacker {
public:
    /**
     * Extract one field, reading further group bytes from input as needed.
     *
     * @param field Bit-field declaration
     * @param input Whole input buffer
     * @param offset Cursor into input; advanced by the bytes newly read
     * @return Field value, or unsupported_width / overlapping_bit_fields /
     *         buffer_overflow (field name left empty for the caller to fill)
     */
    [[nodiscard]] expected<uint64_t, MarshalError> extract(BitField field,
                                                           std::span<const uint8_t> input,
                                                           std::size_t& offset) {
        if (!is_supported(field)) {
            return unexpected(bit_field_error(ErrorCode::unsupported_width, field));
        }
        if ((used_ & placement_mask(field)) != 0) {
            return unexpected(bit_field_error(ErrorCode::overlapping_bit_fields, field));
        }

        const std::size_t needed = (field.offset + field.bits + 7) / 8;
        if (needed > bytes_read_) {
            const std::size_t missing = needed - bytes_read_;
            if (offset + missing > input.size()) {
                return unexpected(MarshalError{.code = ErrorCode::buffer_overflow,
                                               .attempted = offset + missing,
                                               .limit = input.size()});
            }
            while (bytes_read_ < needed) {
                accumulator_ |= uint64_t{input[offset]} << (8 * bytes_read_);
                ++offset;
                ++bytes_read_;
            }
        }

        used_ |= placement_mask(field);
        return wirepack::detail::extract(accumulator_, field);
    }

    [[nodiscard]] bool is_open() const noexcept { return bytes_read_ > 0 || used_ != 0; }

    void reset() noexcept {
        accumulator_ = 0;
        used_ = 0;
        bytes_read_ = 0;
    }

private:
    uint64_t accumulator_{0};
    uint64_t used_{0};
    std::size_t bytes_read_{0};
};

} // namespace wirepack::detail
