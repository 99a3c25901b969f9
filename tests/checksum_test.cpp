#include <array>
#include <vector>

#include <gtest/gtest.h>
#include <wirepack.hpp>
#include <wirepack/packets.hpp>

using namespace wirepack;
using namespace wirepack::packets;

namespace {

struct Unchecked {
    uint16_t first{0};
    uint16_t second{0};

    static const Schema<Unchecked>& schema() {
        static const auto instance = SchemaBuilder<Unchecked>()
                                         .field("first", &Unchecked::first, integer(16))
                                         .field("second", &Unchecked::second, integer(16))
                                         .build();
        return instance;
    }
};

} // namespace

TEST(ChecksumTest, Rfc1071Example) {
    const std::array<uint8_t, 8> bytes{0x00, 0x01, 0xF2, 0x03, 0xF4, 0xF5, 0xF6, 0xF7};
    EXPECT_EQ(internet_checksum(bytes), 0x220D);
}

TEST(ChecksumTest, OddLengthPadsLowByte) {
    const std::array<uint8_t, 1> bytes{0x01};
    EXPECT_EQ(internet_checksum(bytes), 0xFEFF);

    const std::array<uint8_t, 3> longer{0x12, 0x34, 0x56};
    EXPECT_EQ(internet_checksum(longer), static_cast<uint16_t>(~(0x1234 + 0x5600)));
}

TEST(ChecksumTest, EmptyInput) {
    EXPECT_EQ(internet_checksum(std::span<const uint8_t>{}), 0xFFFF);
}

TEST(ChecksumTest, CarriesAreFolded) {
    const std::vector<uint8_t> bytes(64, 0xFF);
    EXPECT_EQ(internet_checksum(bytes), 0x0000);
}

TEST(ChecksumTest, KnownIpv4Header) {
    Ipv4Header header;
    header.total_length = 0x0073;
    header.flags_and_fragment_offset = 0x4000;
    header.ttl = 0x40;
    header.protocol = Ipv4Header::protocol_udp;
    header.source_address = ipv4_address(192, 168, 0, 1);
    header.destination_address = ipv4_address(192, 168, 0, 199);

    EXPECT_EQ(checksum(header).value(), 0xB861);
}

TEST(ChecksumTest, ExistingChecksumIsIgnored) {
    auto packet = IcmpPacket::echo_request(1, 1);
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->checksum, 0xF7FD);

    // checksum() zeroes the field of a copy, so the result is stable
    EXPECT_EQ(checksum(*packet).value(), 0xF7FD);
    EXPECT_EQ(packet->checksum, 0xF7FD);
}

TEST(ChecksumTest, PackedWithChecksumSumsToZero) {
    auto packet = IcmpPacket::create(IcmpPacket::type_echo_request, 0, 0x1234, 7, "ping!");
    ASSERT_TRUE(packet.has_value());
    ASSERT_NE(packet->checksum, 0);

    auto packed = pack(*packet);
    ASSERT_TRUE(packed.has_value());
    EXPECT_EQ(internet_checksum(*packed), 0);
}

TEST(ChecksumTest, RecordWithoutChecksumField) {
    Unchecked record{.first = 0x0102, .second = 0x0304};
    EXPECT_EQ(checksum(record).value(), static_cast<uint16_t>(~0x0406));

    auto unchanged = with_checksum(record);
    ASSERT_TRUE(unchanged.has_value());
    EXPECT_EQ(unchanged->first, 0x0102);
    EXPECT_EQ(unchanged->second, 0x0304);
}

TEST(ChecksumTest, NonZeroChecksumIsKept) {
    IcmpPacket packet{.type = 8, .checksum = 0x1111};
    EXPECT_EQ(with_checksum(packet).value().checksum, 0x1111);
}
