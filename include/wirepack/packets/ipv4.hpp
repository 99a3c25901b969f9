#pragma once

#include "wirepack/checksum.hpp"
#include "wirepack/codec.hpp"
#include "wirepack/schema.hpp"

#include <cstddef>
#include <cstdint>

namespace wirepack::packets {

/// Host-order IPv4 address from dotted-quad octets
constexpr uint32_t ipv4_address(uint8_t a, uint8_t b, uint8_t c, uint8_t d) noexcept {
    return (uint32_t{a} << 24) | (uint32_t{b} << 16) | (uint32_t{c} << 8) | uint32_t{d};
}

/**
 * IPv4 header without options (20 bytes).
 *
 * Version and IHL share the first byte as a bit-field group: IHL occupies the
 * low nibble, version the high nibble, so the default header starts with 0x45.
 * The header checksum covers these 20 bytes only.
 */
struct Ipv4Header {
    static constexpr uint8_t protocol_icmp = 1;
    static constexpr uint8_t protocol_tcp = 6;
    static constexpr uint8_t protocol_udp = 17;
    static constexpr std::size_t size_bytes = 20;

    uint8_t version{4};
    uint8_t header_length{5}; ///< In 32-bit words
    uint8_t type_of_service{0};
    uint16_t total_length{static_cast<uint16_t>(size_bytes)};
    uint16_t identification{0};
    uint16_t flags_and_fragment_offset{0};
    uint8_t ttl{64};
    uint8_t protocol{0};
    uint16_t checksum{0};
    uint32_t source_address{0};
    uint32_t destination_address{0};

    static const Schema<Ipv4Header>& schema() {
        static const auto instance =
            SchemaBuilder<Ipv4Header>()
                .field("version", &Ipv4Header::version, bits(4, 4))
                .validate(Constraint::in({4}))
                .field("header_length", &Ipv4Header::header_length, bits(4, 0))
                .validate(Constraint::min(5))
                .field("type_of_service", &Ipv4Header::type_of_service, integer(8))
                .field("total_length", &Ipv4Header::total_length, integer(16))
                .field("identification", &Ipv4Header::identification, integer(16))
                .field("flags_and_fragment_offset", &Ipv4Header::flags_and_fragment_offset,
                       integer(16))
                .field("ttl", &Ipv4Header::ttl, integer(8))
                .field("protocol", &Ipv4Header::protocol, integer(8))
                .field("checksum", &Ipv4Header::checksum, integer(16))
                .field("source_address", &Ipv4Header::source_address, integer(32))
                .field("destination_address", &Ipv4Header::destination_address, integer(32))
                .build();
        return instance;
    }

    /**
     * Build a header for a payload of payload_length bytes.
     *
     * total_length is derived from payload_length; the checksum is computed.
     */
    [[nodiscard]] static MarshalResult<Ipv4Header> create(uint8_t protocol, uint32_t source_address,
                                                         uint32_t destination_address,
                                                         std::size_t payload_length,
                                                         uint8_t ttl = 64,
                                                         uint16_t identification = 0) {
        const std::size_t total = size_bytes + payload_length;
        if (total > 0xFFFF) {
            return make_marshal_error(ErrorCode::buffer_overflow, "total_length", total, 0xFFFF);
        }
        Ipv4Header header;
        header.total_length = static_cast<uint16_t>(total);
        header.identification = identification;
        header.ttl = ttl;
        header.protocol = protocol;
        header.source_address = source_address;
        header.destination_address = destination_address;
        return with_checksum(header);
    }

    [[nodiscard]] bool dont_fragment() const noexcept {
        return (flags_and_fragment_offset & 0x4000) != 0;
    }

    [[nodiscard]] bool more_fragments() const noexcept {
        return (flags_and_fragment_offset & 0x2000) != 0;
    }

    [[nodiscard]] uint16_t fragment_offset() const noexcept {
        return flags_and_fragment_offset & 0x1FFF;
    }
};

} // namespace wirepack::packets
