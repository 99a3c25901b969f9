#pragma once

#include "wirepack/codec.hpp"
#include "wirepack/schema.hpp"

#include <string>
#include <utility>

#include <cstdint>

namespace wirepack::packets {

/**
 * DNS message header (12 bytes) followed by the raw question, answer,
 * authority and additional sections.
 *
 * The 16-bit flags word is declared as a two-byte bit-field group. Offsets are
 * counted from the least significant bit of the first byte on the wire:
 *
 *   byte 0: QR(7) OPCODE(3-6) AA(2) TC(1) RD(0)
 *   byte 1: RA(15) Z(12-14) RCODE(8-11)
 */
struct DnsHeader {
    static constexpr uint8_t qr_query = 0;
    static constexpr uint8_t qr_response = 1;

    static constexpr uint8_t opcode_query = 0;
    static constexpr uint8_t opcode_iquery = 1;
    static constexpr uint8_t opcode_status = 2;

    static constexpr uint8_t rcode_no_error = 0;
    static constexpr uint8_t rcode_format_error = 1;
    static constexpr uint8_t rcode_server_failure = 2;
    static constexpr uint8_t rcode_name_error = 3;
    static constexpr uint8_t rcode_not_implemented = 4;
    static constexpr uint8_t rcode_refused = 5;

    uint16_t transaction_id{0};
    uint8_t qr{qr_query};
    uint8_t opcode{opcode_query};
    bool authoritative_answer{false};
    bool truncated{false};
    bool recursion_desired{true};
    bool recursion_available{false};
    uint8_t reserved{0};
    uint8_t rcode{rcode_no_error};
    uint16_t question_count{0};
    uint16_t answer_count{0};
    uint16_t authority_count{0};
    uint16_t additional_count{0};
    std::string data;

    static const Schema<DnsHeader>& schema() {
        static const auto instance =
            SchemaBuilder<DnsHeader>()
                .field("transaction_id", &DnsHeader::transaction_id, integer(16))
                .field("qr", &DnsHeader::qr, bits(1, 7))
                .field("opcode", &DnsHeader::opcode, bits(4, 3))
                .field("authoritative_answer", &DnsHeader::authoritative_answer, bits(1, 2))
                .field("truncated", &DnsHeader::truncated, bits(1, 1))
                .field("recursion_desired", &DnsHeader::recursion_desired, bits(1, 0))
                .field("recursion_available", &DnsHeader::recursion_available, bits(1, 15))
                .field("reserved", &DnsHeader::reserved, bits(3, 12))
                .field("rcode", &DnsHeader::rcode, bits(4, 8))
                .field("question_count", &DnsHeader::question_count, integer(16))
                .field("answer_count", &DnsHeader::answer_count, integer(16))
                .field("authority_count", &DnsHeader::authority_count, integer(16))
                .field("additional_count", &DnsHeader::additional_count, integer(16))
                .field("data", &DnsHeader::data, variable_bytes())
                .build();
        return instance;
    }

    /// Standard recursive query carrying question_count questions in data
    [[nodiscard]] static DnsHeader query(uint16_t transaction_id, uint16_t question_count = 1,
                                         std::string data = {}) {
        DnsHeader header;
        header.transaction_id = transaction_id;
        header.question_count = question_count;
        header.data = std::move(data);
        return header;
    }

    /// Flags as the big-endian 16-bit word found on the wire
    [[nodiscard]] uint16_t flags() const noexcept {
        return static_cast<uint16_t>(((qr & 0x1) << 15) | ((opcode & 0xF) << 11) |
                                     (authoritative_answer ? 0x0400 : 0) |
                                     (truncated ? 0x0200 : 0) | (recursion_desired ? 0x0100 : 0) |
                                     (recursion_available ? 0x0080 : 0) |
                                     ((reserved & 0x7) << 4) | (rcode & 0xF));
    }

    void set_flags(uint16_t word) noexcept {
        qr = static_cast<uint8_t>((word >> 15) & 0x1);
        opcode = static_cast<uint8_t>((word >> 11) & 0xF);
        authoritative_answer = (word & 0x0400) != 0;
        truncated = (word & 0x0200) != 0;
        recursion_desired = (word & 0x0100) != 0;
        recursion_available = (word & 0x0080) != 0;
        reserved = static_cast<uint8_t>((word >> 4) & 0x7);
        rcode = static_cast<uint8_t>(word & 0xF);
    }

    [[nodiscard]] bool is_response() const noexcept { return qr == qr_response; }
};

} // namespace wirepack::packets
