#include <gtest/gtest.h>
#include <onionid/hs/error.hpp>

using namespace onionid::hs;

TEST(HsErrorTest, Category)
{
    std::error_code ec = Error::KeyFormat;
    ASSERT_TRUE(ec);
    ASSERT_STREQ(ec.category().name(), "onion service");
    ASSERT_EQ(ec.value(), 1);
}

TEST(HsErrorTest, Messages)
{
    ASSERT_FALSE(make_error_code(Error::KeyFormat).message().empty());
    ASSERT_NE(make_error_code(Error::Decryption).message(), make_error_code(Error::InvalidEncoding).message());
}

TEST(HsErrorTest, ThrowIfTrue)
{
    ASSERT_NO_THROW(ThrowIfTrue(false, Error::Decryption, "not thrown"));
    try
    {
        ThrowIfTrue(true, Error::Decryption, "thrown");
        FAIL() << "exception expected";
    }
    catch (const HsException& e)
    {
        ASSERT_EQ(e.code(), make_error_code(Error::Decryption));
    }
}
