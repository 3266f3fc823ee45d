#include <algorithm>
#include <cstring>
#include <gtest/gtest.h>
#include <onionid/crypto/asymm_key.hpp>
#include <onionid/crypto/bio.hpp>
#include <onionid/crypto/ed25519_asymm_key.hpp>
#include <onionid/crypto/rsa_asymm_key.hpp>
#include <onionid/crypto/error_code.hpp>
#include <onionid/crypto/exception.hpp>

using namespace onionid::crypto;

namespace
{

int FixedPassword(char* buf, int size, int, void* userData)
{
    auto password = static_cast<const char*>(userData);
    auto length = std::min(static_cast<int>(std::strlen(password)), size);
    std::memcpy(buf, password, length);
    return length;
}

} // namespace

TEST(AsymmKeyTest, DerRoundTrip)
{
    auto key = Ed25519AsymmKey::generate();

    auto bio = BioTraits::createMemoryBuffer();
    AsymmKey::toBio(KeyType::Private, key, bio, Encoding::DER);

    auto decoded = AsymmKey::fromBio(KeyType::Private, bio, Encoding::DER);
    ASSERT_NE(decoded, nullptr);
    ASSERT_EQ(Ed25519AsymmKey::getPublicBytes(decoded), Ed25519AsymmKey::getPublicBytes(key));
}

TEST(AsymmKeyTest, PublicPemRoundTrip)
{
    auto key = Ed25519AsymmKey::generate();

    auto bio = BioTraits::createMemoryBuffer();
    AsymmKey::toBio(KeyType::Public, key, bio);

    auto decoded = AsymmKey::fromBio(KeyType::Public, bio, Encoding::PEM);
    ASSERT_NE(decoded, nullptr);
    ASSERT_TRUE(AsymmKey::isAlgorithm(decoded, "ED25519"));
}

TEST(AsymmKeyTest, EncryptedPem)
{
    auto key = RsaAsymmKey::generate(1024);

    auto bio = BioTraits::createMemoryBuffer();
    AsymmKey::toEncryptedBio(key, bio, "AES-128-CBC", "secret");
    auto pem = BioTraits::getMemoryDataAsString(bio);
    ASSERT_NE(pem.find("Proc-Type: 4,ENCRYPTED"), std::string::npos);

    char right[] = "secret";
    auto reader = BioTraits::createMemoryReader(reinterpret_cast<const uint8_t*>(pem.data()), pem.size());
    auto decoded = AsymmKey::fromBio(KeyType::Private, reader, Encoding::PEM, FixedPassword, right);
    ASSERT_NE(decoded, nullptr);
    ASSERT_EQ(AsymmKey::getBits(decoded), 1024);

    char wrong[] = "wrong";
    reader = BioTraits::createMemoryReader(reinterpret_cast<const uint8_t*>(pem.data()), pem.size());
    ASSERT_EQ(AsymmKey::fromBio(KeyType::Private, reader, Encoding::PEM, FixedPassword, wrong), nullptr);
    ClearErrors();
}

TEST(AsymmKeyTest, UnknownCipher)
{
    auto key = RsaAsymmKey::generate(1024);
    auto bio = BioTraits::createMemoryBuffer();
    ASSERT_THROW(AsymmKey::toEncryptedBio(key, bio, "NO-SUCH-CIPHER", "secret"), CryptoException);
}
