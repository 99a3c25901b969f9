#pragma once

#include "wirepack/checksum.hpp"
#include "wirepack/codec.hpp"
#include "wirepack/schema.hpp"

#include <string>
#include <utility>

#include <cstdint>

namespace wirepack::packets {

/**
 * ICMP message: 8-byte header followed by the message body.
 *
 * The checksum covers header and body.
 */
struct IcmpPacket {
    static constexpr uint8_t type_echo_reply = 0;
    static constexpr uint8_t type_destination_unreachable = 3;
    static constexpr uint8_t type_echo_request = 8;
    static constexpr uint8_t type_time_exceeded = 11;

    uint8_t type{0};
    uint8_t code{0};
    uint16_t checksum{0};
    uint16_t identifier{0};
    uint16_t sequence_number{0};
    std::string data;

    static const Schema<IcmpPacket>& schema() {
        static const auto instance = SchemaBuilder<IcmpPacket>()
                                         .field("type", &IcmpPacket::type, "C")
                                         .field("code", &IcmpPacket::code, "C")
                                         .field("checksum", &IcmpPacket::checksum, "n")
                                         .field("identifier", &IcmpPacket::identifier, "n")
                                         .field("sequence_number", &IcmpPacket::sequence_number, "n")
                                         .field("data", &IcmpPacket::data, "A*")
                                         .build();
        return instance;
    }

    /// Build a message; a zero checksum is replaced by the computed one
    [[nodiscard]] static MarshalResult<IcmpPacket> create(uint8_t type, uint8_t code,
                                                         uint16_t identifier = 0,
                                                         uint16_t sequence_number = 0,
                                                         std::string data = {},
                                                         uint16_t checksum = 0) {
        return with_checksum(IcmpPacket{.type = type,
                                        .code = code,
                                        .checksum = checksum,
                                        .identifier = identifier,
                                        .sequence_number = sequence_number,
                                        .data = std::move(data)});
    }

    [[nodiscard]] static MarshalResult<IcmpPacket>
    echo_request(uint16_t identifier, uint16_t sequence_number, std::string data = {}) {
        return create(type_echo_request, 0, identifier, sequence_number, std::move(data));
    }
};

} // namespace wirepack::packets
