// test_payload_frame.cpp - length-prefixed frame and bit packing.

#include <gtest/gtest.h>

#include "payload_frame.hpp"
#include "stego_errors.hpp"

#include <vector>

using namespace dwtstego;

TEST(PayloadFrameTest, HeaderIsBigEndianLength)
{
    std::vector<uint8_t> payload(0x0102, 0xAB);
    std::vector<uint8_t> framed = frame(payload);

    ASSERT_EQ(framed.size(), 4u + payload.size());
    EXPECT_EQ(framed[0], 0x00);
    EXPECT_EQ(framed[1], 0x00);
    EXPECT_EQ(framed[2], 0x01);
    EXPECT_EQ(framed[3], 0x02);
    EXPECT_EQ(framed[4], 0xAB);
}

TEST(PayloadFrameTest, BitsAreMostSignificantFirst)
{
    std::vector<uint8_t> bits = bytesToBits({0x80, 0x01});
    ASSERT_EQ(bits.size(), 16u);
    EXPECT_EQ(bits[0], 1);
    for (int i = 1; i < 15; ++i) EXPECT_EQ(bits[i], 0) << i;
    EXPECT_EQ(bits[15], 1);

    std::vector<uint8_t> len = encodeLength(5);
    ASSERT_EQ(len.size(), 32u);
    EXPECT_EQ(decodeLength(len), 5u);
    EXPECT_EQ(len[29], 1);
    EXPECT_EQ(len[30], 0);
    EXPECT_EQ(len[31], 1);
}

TEST(PayloadFrameTest, UnframeRecoversPayloadAndIgnoresTrailingBits)
{
    const std::vector<uint8_t> payload = {'H', 'e', 'l', 'l', 'o'};
    std::vector<uint8_t> bits = bytesToBits(frame(payload));
    bits.insert(bits.end(), 13, 1);

    Unframed u = unframe(bits);
    EXPECT_EQ(u.length, 5u);
    EXPECT_EQ(u.payload, payload);
}

TEST(PayloadFrameTest, EmptyPayloadIsJustAHeader)
{
    std::vector<uint8_t> bits = bytesToBits(frame({}));
    ASSERT_EQ(bits.size(), 32u);

    Unframed u = unframe(bits);
    EXPECT_EQ(u.length, 0u);
    EXPECT_TRUE(u.payload.empty());
}

TEST(PayloadFrameTest, ShortStreamsRaiseFrameError)
{
    EXPECT_THROW(unframe(std::vector<uint8_t>(31, 0)), FrameError);
    EXPECT_THROW(decodeLength(std::vector<uint8_t>(8, 1)), FrameError);

    // declares 2 bytes, carries 15 bits
    std::vector<uint8_t> bits = encodeLength(2);
    bits.insert(bits.end(), 15, 0);
    EXPECT_THROW(unframe(bits), FrameError);

    EXPECT_THROW(bitsToBytes(std::vector<uint8_t>(9, 0)), FrameError);
}
