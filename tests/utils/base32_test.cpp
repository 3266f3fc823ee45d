#include <gtest/gtest.h>
#include <onionid/utils/base32.hpp>

using namespace onionid::utils;

namespace
{

std::vector<uint8_t> bytes(std::string_view str)
{
    return std::vector<uint8_t>(str.begin(), str.end());
}

} // namespace

TEST(Base32Test, EncodeRfc4648Vectors)
{
    ASSERT_EQ(base32Encode(bytes("")), "");
    ASSERT_EQ(base32Encode(bytes("f")), "my======");
    ASSERT_EQ(base32Encode(bytes("fooba")), "mzxw6ytb");
    ASSERT_EQ(base32Encode(bytes("foobar")), "mzxw6ytboi======");
}

TEST(Base32Test, EncodeIsLowercase)
{
    std::vector<uint8_t> allOnes(10, 0xFF);
    ASSERT_EQ(base32Encode(allOnes), "7777777777777777");
}

TEST(Base32Test, DecodeIgnoresCase)
{
    auto lower = base32Decode("mzxw6ytboi======");
    auto upper = base32Decode("MZXW6YTBOI======");
    ASSERT_TRUE(lower.has_value());
    ASSERT_TRUE(upper.has_value());
    ASSERT_EQ(lower.value(), bytes("foobar"));
    ASSERT_EQ(upper.value(), bytes("foobar"));
}

TEST(Base32Test, DecodeWithoutPadding)
{
    auto decoded = base32Decode("mzxw6ytboi");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded.value(), bytes("foobar"));
}

TEST(Base32Test, DecodeRejectsForeignSymbols)
{
    ASSERT_FALSE(base32Decode("mzxw6yt1").has_value());
    ASSERT_FALSE(base32Decode("mzxw6yt8").has_value());
    ASSERT_FALSE(base32Decode("mzxw-ytb").has_value());
}

TEST(Base32Test, DecodeRejectsImpossibleLength)
{
    ASSERT_FALSE(base32Decode("m").has_value());
    ASSERT_FALSE(base32Decode("mzx").has_value());
    ASSERT_FALSE(base32Decode("mzxw6y").has_value());
    ASSERT_FALSE(base32Decode("my====").has_value());
}
