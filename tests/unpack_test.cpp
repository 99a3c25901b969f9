#include <array>
#include <string>
#include <vector>

#include "test_records.hpp"
#include <gtest/gtest.h>
#include <wirepack.hpp>

using namespace wirepack;
using namespace wirepack_test;

using Bytes = std::vector<uint8_t>;

namespace {

// Guard naming a field that was itself skipped
struct Chained {
    uint8_t type{0};
    uint8_t subtype{0};
    uint8_t detail{0};

    bool operator==(const Chained&) const = default;

    static const Schema<Chained>& schema() {
        static const auto instance = SchemaBuilder<Chained>()
                                         .field("type", &Chained::type, integer(8))
                                         .field("subtype", &Chained::subtype, integer(8))
                                         .when("type", CompareOp::ge, 2)
                                         .field("detail", &Chained::detail, integer(8))
                                         .when("subtype", CompareOp::ne, 0)
                                         .build();
        return instance;
    }
};

// Signed members declared narrower than their type
struct Signed {
    int32_t wide{0};
    int8_t nibble{0};
    int8_t small{0};

    bool operator==(const Signed&) const = default;

    static const Schema<Signed>& schema() {
        static const auto instance = SchemaBuilder<Signed>()
                                         .field("wide", &Signed::wide, integer(16))
                                         .field("nibble", &Signed::nibble, bits(4, 0))
                                         .field("small", &Signed::small, bits(4, 4))
                                         .build();
        return instance;
    }
};

} // namespace

TEST(UnpackTest, RoundTripSimple) {
    Simple record{.a = 0x10, .b = 0x20, .c = 0x30};
    auto packed = pack(record);
    ASSERT_TRUE(packed.has_value());

    auto unpacked = unpack<Simple>(*packed);
    ASSERT_TRUE(unpacked.has_value()) << unpacked.error().message();
    EXPECT_EQ(*unpacked, record);
}

TEST(UnpackTest, RoundTripMixedByteOrders) {
    Mixed record{.big16 = 0xBEEF,
                 .little16 = 0xCAFE,
                 .little32 = 0xDEADBEEF,
                 .big64 = 0x0123456789ABCDEF};

    auto unpacked = unpack<Mixed>(pack(record).value());
    ASSERT_TRUE(unpacked.has_value()) << unpacked.error().message();
    EXPECT_EQ(*unpacked, record);
}

TEST(UnpackTest, BitFieldsFromOneByte) {
    const std::array<uint8_t, 1> input{0x54};

    auto unpacked = unpack<Nibbles>(input);
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_EQ(unpacked->low, 4);
    EXPECT_EQ(unpacked->high, 5);
}

TEST(UnpackTest, ConditionalFieldAbsent) {
    const Bytes input{0x02, 0x7F};

    auto unpacked = unpack<Message>(input);
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_EQ(unpacked->type, 2);
    EXPECT_EQ(unpacked->extension, 0);
    EXPECT_EQ(unpacked->trailer, 0x7F);
}

TEST(UnpackTest, ConditionalFieldPresent) {
    const Bytes input{0x01, 0xAB, 0xCD, 0x7F};

    auto unpacked = unpack<Message>(input);
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_EQ(unpacked->extension, 0xABCD);
    EXPECT_EQ(unpacked->trailer, 0x7F);
}

TEST(UnpackTest, GuardOnSkippedFieldIsFalse) {
    // subtype is skipped because type < 2, so detail's guard cannot hold
    const Bytes input{0x01, 0x05, 0x06};

    auto unpacked = unpack<Chained>(input);
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_EQ(unpacked->subtype, 0);
    EXPECT_EQ(unpacked->detail, 0);

    // pack makes the same decision even if the skipped member holds a value
    Chained record{.type = 1, .subtype = 5, .detail = 6};
    EXPECT_EQ(pack(record).value(), (Bytes{0x01}));
}

TEST(UnpackTest, ChainedGuardsRoundTrip) {
    Chained record{.type = 3, .subtype = 4, .detail = 5};
    EXPECT_EQ(pack(record).value(), (Bytes{0x03, 0x04, 0x05}));
    EXPECT_EQ(unpack<Chained>(pack(record).value()).value(), record);
}

TEST(UnpackTest, FixedAndVariableLengthBytes) {
    const Bytes input{'W', 'I', 'R', 'E', 'b', 'o', 'd', 'y'};

    auto unpacked = unpack<Tagged>(input);
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_EQ(unpacked->tag, "WIRE");
    EXPECT_EQ(unpacked->body, "body");
}

TEST(UnpackTest, VariableLengthMayBeEmpty) {
    const Bytes input{'W', 'I', 'R', 'E'};

    auto unpacked = unpack<Tagged>(input);
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_TRUE(unpacked->body.empty());
}

TEST(UnpackTest, ShortBufferNamesRequiredAndAvailable) {
    const Bytes input{0x01, 0x02};

    auto unpacked = unpack<Simple>(input);
    ASSERT_FALSE(unpacked.has_value());
    EXPECT_EQ(unpacked.error().code, ErrorCode::buffer_overflow);
    EXPECT_EQ(unpacked.error().field, "c");
    EXPECT_EQ(unpacked.error().attempted, 3u);
    EXPECT_EQ(unpacked.error().limit, 2u);
    EXPECT_EQ(unpacked.error().message(),
              "Buffer overflow: requested 3 bytes exceeds available 2 bytes (field 'c')");
}

TEST(UnpackTest, ShortFixedLengthBytes) {
    const Bytes input{'W', 'I'};

    auto unpacked = unpack<Tagged>(input);
    ASSERT_FALSE(unpacked.has_value());
    EXPECT_EQ(unpacked.error().code, ErrorCode::buffer_overflow);
    EXPECT_EQ(unpacked.error().field, "tag");
    EXPECT_EQ(unpacked.error().attempted, 4u);
}

TEST(UnpackTest, EmptyBufferFailsOnFirstField) {
    auto unpacked = unpack<Simple>(Bytes{});
    ASSERT_FALSE(unpacked.has_value());
    EXPECT_EQ(unpacked.error().field, "a");
    EXPECT_EQ(unpacked.error().attempted, 1u);
    EXPECT_EQ(unpacked.error().limit, 0u);
}

TEST(UnpackTest, TrailingBytesAreIgnored) {
    const Bytes input{0x01, 0x02, 0x03, 0x04, 0x05};

    auto unpacked = unpack<Simple>(input);
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_EQ(*unpacked, (Simple{.a = 1, .b = 2, .c = 3}));
}

TEST(UnpackTest, NestedRecordsAdvanceByConsumedBytes) {
    const Bytes input{0x09, 0x02, 0x01, 0x02, 0x03};

    auto unpacked = unpack<DeepNested>(input);
    ASSERT_TRUE(unpacked.has_value()) << unpacked.error().message();
    EXPECT_EQ(unpacked->level, 9);
    EXPECT_EQ(unpacked->child.version, 2);
    EXPECT_EQ(unpacked->child.inner, (Simple{.a = 1, .b = 2, .c = 3}));
}

TEST(UnpackTest, TruncatedNestedRecordNamesInnerField) {
    const Bytes input{0x02, 0x01, 0x02};

    auto unpacked = unpack<Nested>(input);
    ASSERT_FALSE(unpacked.has_value());
    EXPECT_EQ(unpacked.error().code, ErrorCode::buffer_overflow);
    EXPECT_EQ(unpacked.error().field, "c");
}

TEST(UnpackTest, TruncatedBitFieldGroup) {
    auto unpacked = unpack<Nibbles>(Bytes{});
    ASSERT_FALSE(unpacked.has_value());
    EXPECT_EQ(unpacked.error().code, ErrorCode::buffer_overflow);
    EXPECT_EQ(unpacked.error().field, "low");
}

TEST(UnpackTest, SignedMembersRoundTripThroughNarrowFields) {
    Signed record{.wide = -5, .nibble = -1, .small = 7};
    auto packed = pack(record);
    ASSERT_TRUE(packed.has_value());
    EXPECT_EQ(*packed, (Bytes{0xFF, 0xFB, 0x7F}));

    auto back = unpack<Signed>(*packed);
    ASSERT_TRUE(back.has_value()) << back.error().message();
    EXPECT_EQ(*back, record);
}

TEST(UnpackTest, SignedMembersAreSignExtendedFromDeclaredWidth) {
    auto unpacked = unpack<Signed>(Bytes{0x80, 0x00, 0x87});
    ASSERT_TRUE(unpacked.has_value()) << unpacked.error().message();
    EXPECT_EQ(unpacked->wide, -32768);
    EXPECT_EQ(unpacked->nibble, 7);
    EXPECT_EQ(unpacked->small, -8);
}

TEST(UnpackTest, MissingLayoutIsReported) {
    auto unpacked = unpack<Unlaid>(Bytes{0x01, 0x02});
    ASSERT_FALSE(unpacked.has_value());
    EXPECT_EQ(unpacked.error().code, ErrorCode::missing_layout);
    EXPECT_EQ(unpacked.error().field, "b");
}

TEST(UnpackTest, UnsupportedWidthIsReported) {
    auto unpacked = unpack<OddWidth>(Bytes{0x00, 0x07});
    ASSERT_FALSE(unpacked.has_value());
    EXPECT_EQ(unpacked.error().code, ErrorCode::unsupported_width);
    EXPECT_EQ(unpacked.error().field, "value");
    EXPECT_EQ(unpacked.error().attempted, 12u);
}

TEST(UnpackTest, OverlappingBitFieldsAreRejected) {
    auto unpacked = unpack<Overlapping>(Bytes{0xFF});
    ASSERT_FALSE(unpacked.has_value());
    EXPECT_EQ(unpacked.error().code, ErrorCode::overlapping_bit_fields);
    EXPECT_EQ(unpacked.error().field, "second");
}
