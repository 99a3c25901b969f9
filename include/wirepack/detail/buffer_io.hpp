#pragma once

#include "wirepack/detail/endian.hpp"
#include "wirepack/types.hpp"

#include <vector>

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace wirepack::detail {

/**
 * @brief Endian-aware integer read/write helpers
 *
 * Single source of truth for moving 1/2/4/8 byte integers between host values and
 * wire bytes. All accesses go through std::memcpy for alignment safety.
 * Callers validate bounds before reading.
 */

template <typename StorageType>
[[nodiscard]] inline StorageType read_word_unchecked(const uint8_t* data, Endian endian) noexcept {
    StorageType value{};
    std::memcpy(&value, data, sizeof(StorageType));

    if constexpr (sizeof(StorageType) == 1) {
        return value; // No byte swap needed for single byte
    } else if constexpr (sizeof(StorageType) == 2) {
        return endian == Endian::big ? big_to_host16(value) : little_to_host16(value);
    } else if constexpr (sizeof(StorageType) == 4) {
        return endian == Endian::big ? big_to_host32(value) : little_to_host32(value);
    } else {
        return endian == Endian::big ? big_to_host64(value) : little_to_host64(value);
    }
}

template <typename StorageType>
inline void append_word(std::vector<uint8_t>& out, StorageType value, Endian endian) {
    if constexpr (sizeof(StorageType) == 2) {
        value = endian == Endian::big ? host_to_big16(value) : host_to_little16(value);
    } else if constexpr (sizeof(StorageType) == 4) {
        value = endian == Endian::big ? host_to_big32(value) : host_to_little32(value);
    } else if constexpr (sizeof(StorageType) == 8) {
        value = endian == Endian::big ? host_to_big64(value) : host_to_little64(value);
    }

    uint8_t bytes[sizeof(StorageType)];
    std::memcpy(bytes, &value, sizeof(StorageType));
    out.insert(out.end(), bytes, bytes + sizeof(StorageType));
}

/**
 * Read an integer of `width` bytes (1, 2, 4 or 8).
 * @param data Pointer to the first byte; at least `width` bytes must be readable
 */
[[nodiscard]] inline uint64_t read_integer(const uint8_t* data, std::size_t width,
                                           Endian endian) noexcept {
    switch (width) {
        case 1:
            return read_word_unchecked<uint8_t>(data, endian);
        case 2:
            return read_word_unchecked<uint16_t>(data, endian);
        case 4:
            return read_word_unchecked<uint32_t>(data, endian);
        default:
            return read_word_unchecked<uint64_t>(data, endian);
    }
}

/**
 * Append the low `width` bytes (1, 2, 4 or 8) of value in the given byte order.
 */
inline void append_integer(std::vector<uint8_t>& out, uint64_t value, std::size_t width,
                           Endian endian) {
    switch (width) {
        case 1:
            append_word(out, static_cast<uint8_t>(value), endian);
            break;
        case 2:
            append_word(out, static_cast<uint16_t>(value), endian);
            break;
        case 4:
            append_word(out, static_cast<uint32_t>(value), endian);
            break;
        default:
            append_word(out, value, endian);
            break;
    }
}

} // namespace wirepack::detail
