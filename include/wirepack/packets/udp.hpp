#pragma once

#include "wirepack/checksum.hpp"
#include "wirepack/codec.hpp"
#include "wirepack/schema.hpp"

#include <string>
#include <utility>

#include <cstddef>
#include <cstdint>

namespace wirepack::packets {

/**
 * UDP datagram: 8-byte header followed by the payload.
 *
 * The checksum is computed over header and payload only; the IPv4
 * pseudo-header is not included.
 */
struct UdpDatagram {
    static constexpr std::size_t header_size = 8;

    uint16_t source_port{0};
    uint16_t destination_port{0};
    uint16_t length{0};
    uint16_t checksum{0};
    std::string data;

    static const Schema<UdpDatagram>& schema() {
        static const auto instance = SchemaBuilder<UdpDatagram>()
                                         .field("source_port", &UdpDatagram::source_port, "n")
                                         .field("destination_port", &UdpDatagram::destination_port, "n")
                                         .field("length", &UdpDatagram::length, "n")
                                         .validate(Constraint::min(8))
                                         .field("checksum", &UdpDatagram::checksum, "n")
                                         .field("data", &UdpDatagram::data, "A*")
                                         .build();
        return instance;
    }

    /**
     * Build a datagram.
     *
     * A zero length is replaced by header_size + data.size() and a zero
     * checksum by the computed one.
     */
    [[nodiscard]] static MarshalResult<UdpDatagram> create(uint16_t source_port,
                                                          uint16_t destination_port,
                                                          std::string data = {},
                                                          uint16_t length = 0,
                                                          uint16_t checksum = 0) {
        if (length == 0) {
            const std::size_t total = header_size + data.size();
            if (total > 0xFFFF) {
                return make_marshal_error(ErrorCode::buffer_overflow, "length", total, 0xFFFF);
            }
            length = static_cast<uint16_t>(total);
        }
        return with_checksum(UdpDatagram{.source_port = source_port,
                                         .destination_port = destination_port,
                                         .length = length,
                                         .checksum = checksum,
                                         .data = std::move(data)});
    }
};

} // namespace wirepack::packets
