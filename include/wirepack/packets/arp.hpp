#pragma once

#include "wirepack/codec.hpp"
#include "wirepack/schema.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <charconv>
#include <cstddef>
#include <cstdint>

namespace wirepack::packets {

/**
 * Parse "aa:bb:cc:dd:ee:ff" (or '-' separated) into 6 raw bytes.
 * @throws std::invalid_argument if text is not six 1-2 digit hex groups
 */
inline std::string mac_to_bytes(std::string_view text) {
    std::string bytes;
    std::size_t position = 0;
    while (bytes.size() < 6) {
        const auto end = text.find_first_of(":-", position);
        const auto group = text.substr(position, end == std::string_view::npos ? text.size() - position
                                                                                : end - position);
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(group.data(), group.data() + group.size(), value, 16);
        if (group.empty() || group.size() > 2 || ec != std::errc() ||
            ptr != group.data() + group.size()) {
            throw std::invalid_argument("Invalid MAC address format: " + std::string(text));
        }
        bytes.push_back(static_cast<char>(value));

        const bool last = bytes.size() == 6;
        if (last != (end == std::string_view::npos)) {
            throw std::invalid_argument("Invalid MAC address format: " + std::string(text));
        }
        position = end + 1;
    }
    return bytes;
}

/**
 * Format 6 raw bytes as lowercase "aa:bb:cc:dd:ee:ff".
 * @throws std::invalid_argument if bytes is not exactly 6 bytes long
 */
inline std::string bytes_to_mac(std::string_view bytes) {
    if (bytes.size() != 6) {
        throw std::invalid_argument("Invalid binary MAC address length: " +
                                    std::to_string(bytes.size()));
    }
    constexpr std::string_view digits = "0123456789abcdef";
    std::string text;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        const auto byte = static_cast<uint8_t>(bytes[i]);
        if (i > 0) {
            text.push_back(':');
        }
        text.push_back(digits[byte >> 4]);
        text.push_back(digits[byte & 0x0F]);
    }
    return text;
}

/**
 * ARP packet for Ethernet/IPv4 (28 bytes).
 *
 * Hardware addresses are raw 6-byte strings; use mac_to_bytes() and
 * bytes_to_mac() to convert from and to text.
 */
struct ArpPacket {
    static constexpr uint16_t hardware_type_ethernet = 1;
    static constexpr uint16_t protocol_type_ipv4 = 0x0800;
    static constexpr uint16_t operation_request = 1;
    static constexpr uint16_t operation_reply = 2;

    uint16_t hardware_type{hardware_type_ethernet};
    uint16_t protocol_type{protocol_type_ipv4};
    uint8_t hardware_address_length{6};
    uint8_t protocol_address_length{4};
    uint16_t operation{operation_request};
    std::string sender_hardware_address = std::string(6, '\0');
    uint32_t sender_protocol_address{0};
    std::string target_hardware_address = std::string(6, '\0');
    uint32_t target_protocol_address{0};

    static const Schema<ArpPacket>& schema() {
        static const auto instance =
            SchemaBuilder<ArpPacket>()
                .field("hardware_type", &ArpPacket::hardware_type, "n")
                .field("protocol_type", &ArpPacket::protocol_type, "n")
                .field("hardware_address_length", &ArpPacket::hardware_address_length, "C")
                .validate(Constraint::in({6}))
                .field("protocol_address_length", &ArpPacket::protocol_address_length, "C")
                .validate(Constraint::in({4}))
                .field("operation", &ArpPacket::operation, "n")
                .validate(Constraint::in({operation_request, operation_reply})
                              .with_message("ARP operation must be request (1) or reply (2)"))
                .field("sender_hardware_address", &ArpPacket::sender_hardware_address, "A6")
                .field("sender_protocol_address", &ArpPacket::sender_protocol_address, "N")
                .field("target_hardware_address", &ArpPacket::target_hardware_address, "A6")
                .field("target_protocol_address", &ArpPacket::target_protocol_address, "N")
                .build();
        return instance;
    }

    /// Who-has request for target_ip; the target hardware address is left zero
    [[nodiscard]] static ArpPacket request(std::string_view sender_mac, uint32_t sender_ip,
                                           uint32_t target_ip) {
        ArpPacket packet;
        packet.operation = operation_request;
        packet.sender_hardware_address = mac_to_bytes(sender_mac);
        packet.sender_protocol_address = sender_ip;
        packet.target_protocol_address = target_ip;
        return packet;
    }

    [[nodiscard]] static ArpPacket reply(std::string_view sender_mac, uint32_t sender_ip,
                                         std::string_view target_mac, uint32_t target_ip) {
        ArpPacket packet;
        packet.operation = operation_reply;
        packet.sender_hardware_address = mac_to_bytes(sender_mac);
        packet.sender_protocol_address = sender_ip;
        packet.target_hardware_address = mac_to_bytes(target_mac);
        packet.target_protocol_address = target_ip;
        return packet;
    }
};

} // namespace wirepack::packets
