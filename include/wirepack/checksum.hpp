#pragma once

#include "wirepack/codec.hpp"
#include "wirepack/error.hpp"
#include "wirepack/schema.hpp"

#include <span>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace wirepack {

/// Name of the field zeroed before a record's checksum is computed
inline constexpr std::string_view checksum_field_name = "checksum";

/**
 * @brief RFC 1071 Internet checksum
 *
 * One's complement of the one's complement sum of the big-endian 16-bit words
 * of bytes. An odd trailing byte is padded with a zero low byte.
 * Summing a buffer that already contains its own correct checksum yields 0.
 */
[[nodiscard]] constexpr uint16_t internet_checksum(std::span<const uint8_t> bytes) noexcept {
    uint64_t sum = 0;
    std::size_t i = 0;
    for (; i + 1 < bytes.size(); i += 2) {
        sum += (uint64_t{bytes[i]} << 8) | bytes[i + 1];
    }
    if (i < bytes.size()) {
        sum += uint64_t{bytes[i]} << 8;
    }
    while ((sum >> 16) != 0) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum & 0xFFFF);
}

/**
 * @brief Internet checksum of a record
 *
 * Packs a copy of record whose `checksum` field (if the schema has an integer
 * field of that name) is zero, and checksums the result. The record itself is
 * not modified.
 */
template <Record R>
[[nodiscard]] MarshalResult<uint16_t> checksum(const R& record) {
    R clone = record;
    const auto* field = R::schema().find(checksum_field_name);
    if (field != nullptr && field->access.category == ValueCategory::integer) {
        field->access.write_integer(clone, 0, 16);
    }

    auto packed = pack(clone);
    if (!packed) {
        return unexpected(packed.error());
    }
    return internet_checksum(*packed);
}

/**
 * @brief Fill in a zero `checksum` field
 *
 * Returns record unchanged if it has no integer `checksum` field or the field
 * is already non-zero.
 */
template <Record R>
[[nodiscard]] MarshalResult<R> with_checksum(R record) {
    const auto* field = R::schema().find(checksum_field_name);
    if (field == nullptr || field->access.category != ValueCategory::integer ||
        field->access.read_integer(record).raw != 0) {
        return record;
    }

    auto sum = checksum(record);
    if (!sum) {
        return unexpected(sum.error());
    }
    field->access.write_integer(record, *sum, 16);
    return record;
}

} // namespace wirepack
