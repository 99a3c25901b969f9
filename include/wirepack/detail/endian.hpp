#pragma once

#include <bit>

#include <cstdint>

namespace wirepack::detail {

// Platform endianness detection
inline constexpr bool is_little_endian = (std::endian::native == std::endian::little);
inline constexpr bool is_big_endian = (std::endian::native == std::endian::big);

static_assert(is_little_endian || is_big_endian, "Mixed endianness not supported");

// Byte swap operations (constexpr for compile-time use)
constexpr uint16_t byteswap16(uint16_t value) noexcept {
    return __builtin_bswap16(value);
}

constexpr uint32_t byteswap32(uint32_t value) noexcept {
    return __builtin_bswap32(value);
}

constexpr uint64_t byteswap64(uint64_t value) noexcept {
    return __builtin_bswap64(value);
}

// Host <-> big-endian (network order)
constexpr uint16_t host_to_big16(uint16_t value) noexcept {
    if constexpr (is_little_endian) {
        return byteswap16(value);
    } else {
        return value;
    }
}

constexpr uint32_t host_to_big32(uint32_t value) noexcept {
    if constexpr (is_little_endian) {
        return byteswap32(value);
    } else {
        return value;
    }
}

constexpr uint64_t host_to_big64(uint64_t value) noexcept {
    if constexpr (is_little_endian) {
        return byteswap64(value);
    } else {
        return value;
    }
}

// Host <-> little-endian
constexpr uint16_t host_to_little16(uint16_t value) noexcept {
    if constexpr (is_big_endian) {
        return byteswap16(value);
    } else {
        return value;
    }
}

constexpr uint32_t host_to_little32(uint32_t value) noexcept {
    if constexpr (is_big_endian) {
        return byteswap32(value);
    } else {
        return value;
    }
}

constexpr uint64_t host_to_little64(uint64_t value) noexcept {
    if constexpr (is_big_endian) {
        return byteswap64(value);
    } else {
        return value;
    }
}

// The conversions are involutions, so the reverse direction is the same operation
constexpr uint16_t big_to_host16(uint16_t value) noexcept {
    return host_to_big16(value);
}

constexpr uint32_t big_to_host32(uint32_t value) noexcept {
    return host_to_big32(value);
}

constexpr uint64_t big_to_host64(uint64_t value) noexcept {
    return host_to_big64(value);
}

constexpr uint16_t little_to_host16(uint16_t value) noexcept {
    return host_to_little16(value);
}

constexpr uint32_t little_to_host32(uint32_t value) noexcept {
    return host_to_little32(value);
}

constexpr uint64_t little_to_host64(uint64_t value) noexcept {
    return host_to_little64(value);
}

} // namespace wirepack::detail
