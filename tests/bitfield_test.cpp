#include <span>
#include <vector>

#include <gtest/gtest.h>
#include <wirepack/detail/bitfield.hpp>

using namespace wirepack;
using namespace wirepack::detail;

TEST(BitFieldTest, MaskCalculation) {
    EXPECT_EQ(calculate_mask(1), 0x1u);
    EXPECT_EQ(calculate_mask(4), 0xFu);
    EXPECT_EQ(calculate_mask(13), 0x1FFFu);
    EXPECT_EQ(calculate_mask(64), ~uint64_t{0});
}

TEST(BitFieldTest, InsertAndExtract) {
    uint64_t word = 0;
    word = insert(word, BitField{4, 0}, 4);
    word = insert(word, BitField{4, 4}, 5);
    EXPECT_EQ(word, 0x54u);
    EXPECT_EQ(extract(word, BitField{4, 0}), 4u);
    EXPECT_EQ(extract(word, BitField{4, 4}), 5u);
}

TEST(BitFieldTest, InsertMasksExcessBits) {
    EXPECT_EQ(insert(0, BitField{3, 2}, 0xFF), 0x1Cu);
}

TEST(BitFieldTest, PackerFlushesWholeBytesLsbFirst) {
    BitFieldPacker packer;
    ASSERT_TRUE(packer.add(BitField{4, 0}, 0x4).has_value());
    ASSERT_TRUE(packer.add(BitField{4, 4}, 0x5).has_value());
    ASSERT_TRUE(packer.add(BitField{3, 8}, 0x7).has_value());
    EXPECT_TRUE(packer.is_open());

    std::vector<uint8_t> out;
    EXPECT_EQ(packer.flush(out), 2u);
    EXPECT_EQ(out, (std::vector<uint8_t>{0x54, 0x07}));
    EXPECT_FALSE(packer.is_open());
}

TEST(BitFieldTest, PackerGroupSizeFollowsHighestBit) {
    BitFieldPacker packer;
    ASSERT_TRUE(packer.add(BitField{1, 15}, 1).has_value());

    std::vector<uint8_t> out;
    EXPECT_EQ(packer.flush(out), 2u);
    EXPECT_EQ(out, (std::vector<uint8_t>{0x00, 0x80}));
}

TEST(BitFieldTest, FlushWithoutGroupEmitsNothing) {
    BitFieldPacker packer;
    std::vector<uint8_t> out;
    EXPECT_EQ(packer.flush(out), 0u);
    EXPECT_TRUE(out.empty());
}

TEST(BitFieldTest, PackerRejectsOverlap) {
    BitFieldPacker packer;
    ASSERT_TRUE(packer.add(BitField{4, 0}, 1).has_value());

    auto result = packer.add(BitField{2, 3}, 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::overlapping_bit_fields);
    EXPECT_EQ(result.error().attempted, 2u);
    EXPECT_EQ(result.error().limit, 3u);
}

TEST(BitFieldTest, PackerRejectsUnsupportedWidth) {
    BitFieldPacker packer;
    EXPECT_EQ(packer.add(BitField{0, 0}, 0).error().code, ErrorCode::unsupported_width);
    EXPECT_EQ(packer.add(BitField{65, 0}, 0).error().code, ErrorCode::unsupported_width);
    EXPECT_EQ(packer.add(BitField{8, 57}, 0).error().code, ErrorCode::unsupported_width);
    EXPECT_FALSE(packer.is_open());
}

TEST(BitFieldTest, UnpackerReadsOnlyNeededBytes) {
    const std::vector<uint8_t> input{0x54, 0x07, 0xAA};
    BitFieldUnpacker unpacker;
    std::size_t offset = 0;

    auto low = unpacker.extract(BitField{4, 0}, input, offset);
    ASSERT_TRUE(low.has_value());
    EXPECT_EQ(*low, 4u);
    EXPECT_EQ(offset, 1u);

    auto high = unpacker.extract(BitField{4, 4}, input, offset);
    ASSERT_TRUE(high.has_value());
    EXPECT_EQ(*high, 5u);
    EXPECT_EQ(offset, 1u);

    auto next = unpacker.extract(BitField{3, 8}, input, offset);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, 7u);
    EXPECT_EQ(offset, 2u);
}

TEST(BitFieldTest, UnpackerReportsShortInput) {
    const std::vector<uint8_t> input{0xFF};
    BitFieldUnpacker unpacker;
    std::size_t offset = 0;

    auto result = unpacker.extract(BitField{4, 12}, input, offset);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::buffer_overflow);
    EXPECT_EQ(result.error().attempted, 2u);
    EXPECT_EQ(result.error().limit, 1u);
    EXPECT_EQ(offset, 0u);
}

TEST(BitFieldTest, UnpackerRejectsOverlap) {
    const std::vector<uint8_t> input{0xFF};
    BitFieldUnpacker unpacker;
    std::size_t offset = 0;

    ASSERT_TRUE(unpacker.extract(BitField{4, 0}, input, offset).has_value());
    auto result = unpacker.extract(BitField{1, 3}, input, offset);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::overlapping_bit_fields);
}

TEST(BitFieldTest, ResetStartsNewGroup) {
    const std::vector<uint8_t> input{0x01, 0x02};
    BitFieldUnpacker unpacker;
    std::size_t offset = 0;

    EXPECT_EQ(unpacker.extract(BitField{8, 0}, input, offset).value(), 1u);
    unpacker.reset();
    EXPECT_FALSE(unpacker.is_open());
    EXPECT_EQ(unpacker.extract(BitField{8, 0}, input, offset).value(), 2u);
    EXPECT_EQ(offset, 2u);
}
