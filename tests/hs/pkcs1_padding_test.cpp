#include <algorithm>
#include <gtest/gtest.h>
#include <onionid/hs/pkcs1_padding.hpp>
#include <onionid/hs/error.hpp>

using namespace onionid::hs;

TEST(Pkcs1PaddingTest, ShortMessage)
{
    const std::vector<uint8_t> message{0x61, 0x62, 0x63};
    auto padded = AddPkcs1Padding(message);

    ASSERT_EQ(padded.size(), 128U);
    ASSERT_EQ(padded[0], 0x00);
    ASSERT_EQ(padded[1], 0x01);
    for (size_t i = 2; i < 124; ++i)
    {
        ASSERT_EQ(padded[i], 0xFF) << "at " << i;
    }
    ASSERT_EQ(padded[124], 0x00);
    ASSERT_EQ(padded[125], 0x61);
    ASSERT_EQ(padded[126], 0x62);
    ASSERT_EQ(padded[127], 0x63);
}

TEST(Pkcs1PaddingTest, EmptyMessage)
{
    auto padded = AddPkcs1Padding({});
    ASSERT_EQ(std::count(padded.begin(), padded.end(), 0xFF), 125);
    ASSERT_EQ(padded[127], 0x00);
}

TEST(Pkcs1PaddingTest, LongestMessage)
{
    const std::vector<uint8_t> message(kMaxPkcs1MessageSize, 0x42);
    auto padded = AddPkcs1Padding(message);

    ASSERT_EQ(padded[0], 0x00);
    ASSERT_EQ(padded[1], 0x01);
    ASSERT_EQ(padded[2], 0x00);
    ASSERT_TRUE(std::all_of(padded.begin() + 3, padded.end(), [](uint8_t b) { return b == 0x42; }));
}

TEST(Pkcs1PaddingTest, MessageTooLong)
{
    const std::vector<uint8_t> message(kMaxPkcs1MessageSize + 1, 0x42);
    ASSERT_THROW(AddPkcs1Padding(message), HsException);
}
