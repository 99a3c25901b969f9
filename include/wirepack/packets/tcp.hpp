#pragma once

#include "wirepack/checksum.hpp"
#include "wirepack/codec.hpp"
#include "wirepack/schema.hpp"

#include <string>
#include <utility>

#include <cstdint>

namespace wirepack::packets {

// TCP control bits, as stored in the low 9 bits of data_offset_and_flags
namespace tcp_flags {
inline constexpr uint16_t fin = 0x001;
inline constexpr uint16_t syn = 0x002;
inline constexpr uint16_t rst = 0x004;
inline constexpr uint16_t psh = 0x008;
inline constexpr uint16_t ack = 0x010;
inline constexpr uint16_t urg = 0x020;
inline constexpr uint16_t ece = 0x040;
inline constexpr uint16_t cwr = 0x080;
inline constexpr uint16_t ns = 0x100;
inline constexpr uint16_t mask = 0x1FF;
} // namespace tcp_flags

/**
 * TCP segment without options (20-byte header) followed by the payload.
 *
 * data_offset_and_flags holds the 4-bit data offset in its top nibble and the
 * control bits in its low 9 bits. The checksum is computed over header and
 * payload only; the IPv4 pseudo-header is not included.
 */
struct TcpSegment {
    uint16_t source_port{0};
    uint16_t destination_port{0};
    uint32_t sequence_number{0};
    uint32_t acknowledgment_number{0};
    uint16_t data_offset_and_flags{0x5000};
    uint16_t window_size{65535};
    uint16_t checksum{0};
    uint16_t urgent_pointer{0};
    std::string data;

    static const Schema<TcpSegment>& schema() {
        static const auto instance =
            SchemaBuilder<TcpSegment>()
                .field("source_port", &TcpSegment::source_port, "n")
                .field("destination_port", &TcpSegment::destination_port, "n")
                .field("sequence_number", &TcpSegment::sequence_number, "N")
                .field("acknowledgment_number", &TcpSegment::acknowledgment_number, "N")
                .field("data_offset_and_flags", &TcpSegment::data_offset_and_flags, "n")
                .field("window_size", &TcpSegment::window_size, "n")
                .field("checksum", &TcpSegment::checksum, "n")
                .field("urgent_pointer", &TcpSegment::urgent_pointer, "n")
                .field("data", &TcpSegment::data, "A*")
                .build();
        return instance;
    }

    /// Build a segment; a zero checksum is replaced by the computed one
    [[nodiscard]] static MarshalResult<TcpSegment>
    create(uint16_t source_port, uint16_t destination_port, uint32_t sequence_number,
           uint16_t flags = 0, uint32_t acknowledgment_number = 0, std::string data = {},
           uint16_t window_size = 65535, uint16_t checksum = 0) {
        TcpSegment segment{.source_port = source_port,
                           .destination_port = destination_port,
                           .sequence_number = sequence_number,
                           .acknowledgment_number = acknowledgment_number,
                           .window_size = window_size,
                           .checksum = checksum,
                           .data = std::move(data)};
        segment.set_flags(flags);
        return with_checksum(std::move(segment));
    }

    /**
     * Replace control bits and data offset.
     * @param flags OR of tcp_flags values; bits outside tcp_flags::mask are ignored
     * @param data_offset Header length in 32-bit words (4 bits)
     */
    void set_flags(uint16_t flags, uint8_t data_offset = 5) noexcept {
        data_offset_and_flags =
            static_cast<uint16_t>(((data_offset & 0x0F) << 12) | (flags & tcp_flags::mask));
    }

    [[nodiscard]] uint16_t flags() const noexcept { return data_offset_and_flags & tcp_flags::mask; }

    [[nodiscard]] bool has_flag(uint16_t flag) const noexcept { return (flags() & flag) == flag; }

    [[nodiscard]] uint8_t data_offset() const noexcept {
        return static_cast<uint8_t>(data_offset_and_flags >> 12);
    }
};

} // namespace wirepack::packets
