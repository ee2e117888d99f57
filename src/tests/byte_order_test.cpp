#include <gtest/gtest.h>
#include "crypto/byte_order.hpp"
#include <vector>

using namespace slicer::crypto;

TEST(ByteOrderTest, BigEndianConversion) {
    uint32_t original = 0x12345678;
    uint32_t big = ByteOrder::toBigEndian(original);
    uint32_t host = ByteOrder::fromBigEndian(big);

    EXPECT_EQ(host, original);
}

TEST(ByteOrderTest, EndianCheck) {
    bool isLittle = ByteOrder::isLittleEndian();
    // The actual value is platform-dependent, only consistency is checked
    EXPECT_EQ(isLittle, ByteOrder::isLittleEndian());
}

TEST(ByteOrderTest, DifferentTypes) {
    uint16_t u16 = 0x1234;
    uint32_t u32 = 0x12345678;
    uint64_t u64 = 0x1234567890ABCDEF;

    EXPECT_EQ(ByteOrder::fromBigEndian(ByteOrder::toBigEndian(u16)), u16);
    EXPECT_EQ(ByteOrder::fromBigEndian(ByteOrder::toBigEndian(u32)), u32);
    EXPECT_EQ(ByteOrder::fromBigEndian(ByteOrder::toBigEndian(u64)), u64);
}

// Archive headers rely on this exact layout
TEST(ByteOrderTest, PutBigEndianWritesMostSignificantByteFirst) {
    uint8_t buf[8] = {};

    EXPECT_EQ(ByteOrder::putBigEndian(buf, static_cast<uint16_t>(0x0102)), 2u);
    EXPECT_EQ(buf[0], 0x01);
    EXPECT_EQ(buf[1], 0x02);

    EXPECT_EQ(ByteOrder::putBigEndian(buf, static_cast<uint32_t>(0xA1B2C3D4)), 4u);
    EXPECT_EQ(std::vector<uint8_t>(buf, buf + 4), (std::vector<uint8_t>{0xA1, 0xB2, 0xC3, 0xD4}));

    EXPECT_EQ(ByteOrder::putBigEndian(buf, static_cast<uint64_t>(42)), 8u);
    EXPECT_EQ(std::vector<uint8_t>(buf, buf + 8), (std::vector<uint8_t>{0, 0, 0, 0, 0, 0, 0, 42}));
}
