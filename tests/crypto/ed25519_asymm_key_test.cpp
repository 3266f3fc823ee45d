#include <gtest/gtest.h>
#include <onionid/crypto/asymm_key.hpp>
#include <onionid/crypto/ed25519_asymm_key.hpp>
#include <onionid/crypto/rsa_asymm_key.hpp>
#include <onionid/crypto/exception.hpp>
#include <onionid/utils/hexlify.hpp>

using namespace onionid;
using namespace onionid::crypto;

namespace
{

// RFC 8032, section 7.1, test 1.
constexpr std::string_view kSecretKey{"9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"};
constexpr std::string_view kPublicKey{"d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"};

} // namespace

TEST(Ed25519AsymmKeyTest, Generate)
{
    auto key = Ed25519AsymmKey::generate();
    ASSERT_NE(key, nullptr);
    EXPECT_TRUE(AsymmKey::isAlgorithm(key, "ED25519"));
}

TEST(Ed25519AsymmKeyTest, PublicKeyFromSecret)
{
    auto secret = utils::unhexlify(kSecretKey);
    auto key = Ed25519AsymmKey::fromPrivateBytes(secret);

    auto publicKey = Ed25519AsymmKey::getPublicBytes(key);
    ASSERT_EQ(utils::hexlify(publicKey), kPublicKey);
}

TEST(Ed25519AsymmKeyTest, FromPublicBytes)
{
    auto publicKey = utils::unhexlify(kPublicKey);
    auto key = Ed25519AsymmKey::fromPublicBytes(publicKey);

    auto raw = Ed25519AsymmKey::getPublicBytes(key);
    ASSERT_TRUE(std::equal(raw.begin(), raw.end(), publicKey.begin(), publicKey.end()));
}

TEST(Ed25519AsymmKeyTest, InvalidLength)
{
    std::vector<uint8_t> shortKey(31, 0x01);
    ASSERT_THROW(Ed25519AsymmKey::fromPrivateBytes(shortKey), CryptoException);
    ASSERT_THROW(Ed25519AsymmKey::fromPublicBytes(shortKey), CryptoException);
}

TEST(Ed25519AsymmKeyTest, NoRsaPublicSequence)
{
    auto key = Ed25519AsymmKey::generate();
    ASSERT_THROW(RsaAsymmKey::encodePublicSequence(key), CryptoException);
}
