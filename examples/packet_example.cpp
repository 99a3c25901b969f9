#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <wirepack.hpp>
#include <wirepack/packets.hpp>

using namespace wirepack;
using namespace wirepack::packets;

// Helper function to print bytes as hex
void printBytes(const std::vector<uint8_t>& bytes, const std::string& label) {
    std::cout << label << " (" << bytes.size() << " bytes):\n ";
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        std::cout << " " << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<unsigned>(bytes[i]);
        if (i % 16 == 15 && i + 1 < bytes.size()) {
            std::cout << "\n ";
        }
    }
    std::cout << std::dec << "\n\n";
}

// A user-defined record with a bit-field byte and a conditional field
struct Telemetry {
    uint8_t version{1};
    uint8_t priority{0};
    bool has_timestamp{false};
    uint32_t timestamp{0};
    std::string payload;

    static const Schema<Telemetry>& schema() {
        static const auto instance =
            SchemaBuilder<Telemetry>()
                .field("version", &Telemetry::version, bits(3, 0))
                .validate(Constraint::in({1, 2}))
                .field("priority", &Telemetry::priority, bits(4, 3))
                .field("has_timestamp", &Telemetry::has_timestamp, bits(1, 7))
                .field("timestamp", &Telemetry::timestamp, integer(32, Endian::little))
                .when("has_timestamp", CompareOp::eq, 1)
                .field("payload", &Telemetry::payload, variable_bytes())
                .build();
        return instance;
    }
};

int main() {
    std::cout << "wirepack Examples\n";
    std::cout << "=================\n\n";

    // Example 1: ICMP echo request with computed checksum
    auto echo = IcmpPacket::echo_request(0x1234, 1, "hello");
    if (!echo) {
        std::cerr << "ICMP: " << echo.error().message() << "\n";
        return 1;
    }
    auto echo_bytes = pack(*echo);
    printBytes(echo_bytes.value(), "ICMP echo request");

    // Example 2: IPv4 header for that message
    auto ip = Ipv4Header::create(Ipv4Header::protocol_icmp, ipv4_address(192, 168, 0, 10),
                                 ipv4_address(192, 168, 0, 1), echo_bytes.value().size());
    if (!ip) {
        std::cerr << "IPv4: " << ip.error().message() << "\n";
        return 1;
    }
    printBytes(pack(*ip).value(), "IPv4 header");

    // Example 3: Decoding a DNS response header
    const std::vector<uint8_t> dns_wire{0x12, 0x34, 0x81, 0x80, 0x00, 0x01,
                                        0x00, 0x01, 0x00, 0x00, 0x00, 0x00};
    auto dns = unpack<DnsHeader>(dns_wire);
    if (dns) {
        std::cout << "DNS id=0x" << std::hex << dns->transaction_id << std::dec
                  << " response=" << dns->is_response() << " answers=" << dns->answer_count
                  << "\n\n";
    }

    // Example 4: Custom record round trip
    Telemetry sample{.version = 2, .priority = 9, .has_timestamp = true, .timestamp = 1699000000,
                     .payload = "temp=21.5"};
    auto sample_bytes = pack(sample);
    printBytes(sample_bytes.value(), "Telemetry");

    auto decoded = unpack<Telemetry>(sample_bytes.value());
    if (decoded) {
        std::cout << "Decoded priority=" << static_cast<unsigned>(decoded->priority)
                  << " timestamp=" << decoded->timestamp << " payload=" << decoded->payload
                  << "\n\n";
    }

    // Example 5: Hostile input is rejected with a structured error
    SecurityLimits limits;
    limits.set_max_buffer_size(8);
    auto rejected = unpack<Telemetry>(std::vector<uint8_t>(64, 0xFF), limits);
    if (!rejected) {
        std::cout << "Rejected: " << rejected.error().message() << "\n";
    }

    return 0;
}
