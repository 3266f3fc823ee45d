#include <algorithm>
#include <gtest/gtest.h>
#include <onionid/hs/onion_address.hpp>
#include <onionid/hs/error.hpp>
#include <onionid/crypto/ed25519_asymm_key.hpp>
#include <onionid/utils/base32.hpp>
#include <onionid/utils/hexlify.hpp>

using namespace onionid;
using namespace onionid::hs;

namespace
{

// RFC 8032, section 7.1, test 1.
constexpr std::string_view kPublicKey{"d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"};
constexpr std::string_view kAddressV3{"25njqamcweflpvkl73j4szahhihoc4xt3ktcgjnpaingr5yhkenl5sid"};

Ed25519KeyMaterial::RawKey TestPublicKey()
{
    auto bytes = utils::unhexlify(kPublicKey);
    Ed25519KeyMaterial::RawKey publicKey{};
    std::copy(bytes.begin(), bytes.end(), publicKey.begin());
    return publicKey;
}

} // namespace

TEST(OnionAddressTest, EncodeV2)
{
    PermanentId permanentId{};
    ASSERT_EQ(EncodeOnionAddressV2(permanentId), "aaaaaaaaaaaaaaaa");

    permanentId[0] = 0x80;
    ASSERT_EQ(EncodeOnionAddressV2(permanentId), "qaaaaaaaaaaaaaaa");
}

TEST(OnionAddressTest, DecodeV2)
{
    auto permanentId = DecodeOnionAddress("ljqi67fioqpicui2");
    ASSERT_EQ(utils::hexlify(permanentId), "5a608f7ca8741e81511a");
}

TEST(OnionAddressTest, DecodeV2IgnoresCase)
{
    ASSERT_EQ(DecodeOnionAddress("LJQI67FIOQPICUI2"), DecodeOnionAddress("ljqi67fioqpicui2"));
}

TEST(OnionAddressTest, DecodeV2RejectsBadInput)
{
    try
    {
        DecodeOnionAddress("ljqi67fioqpicu!2");
        FAIL() << "exception expected";
    }
    catch (const HsException& e)
    {
        ASSERT_EQ(e.code(), Error::InvalidEncoding);
    }

    ASSERT_THROW(DecodeOnionAddress("ljqi67fioqpicui2aa"), HsException);
    ASSERT_THROW(DecodeOnionAddress(""), HsException);
}

TEST(OnionAddressTest, ChecksumOfKnownKey)
{
    auto checksum = CalcOnionChecksum(TestPublicKey(), kOnionAddressVersion);
    ASSERT_EQ(utils::hexlify(checksum), "bec9");
}

TEST(OnionAddressTest, EncodeV3)
{
    auto address = EncodeOnionAddressV3(TestPublicKey());
    ASSERT_EQ(address.size(), kOnionAddressV3Length);
    ASSERT_EQ(address, kAddressV3);
}

TEST(OnionAddressTest, AddressOfEd25519Key)
{
    auto key = Ed25519KeyMaterial::fromPublicBytes(TestPublicKey());
    ASSERT_EQ(CalcOnionAddress(KeyMaterial(key)), kAddressV3);
}

TEST(OnionAddressTest, DecodeV3)
{
    ASSERT_EQ(DecodeOnionAddressV3(kAddressV3), TestPublicKey());

    std::string upper(kAddressV3);
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    ASSERT_EQ(DecodeOnionAddressV3(upper), TestPublicKey());
}

TEST(OnionAddressTest, DecodeV3RejectsBadChecksum)
{
    std::string address(kAddressV3);
    address[0] = (address[0] == 'a') ? 'b' : 'a';
    ASSERT_THROW(DecodeOnionAddressV3(address), HsException);
}

TEST(OnionAddressTest, DecodeV3RejectsWrongVersion)
{
    auto publicKey = TestPublicKey();
    auto checksum = CalcOnionChecksum(publicKey, 0x02);

    std::vector<uint8_t> raw(publicKey.begin(), publicKey.end());
    raw.insert(raw.end(), checksum.begin(), checksum.end());
    raw.push_back(0x02);

    ASSERT_THROW(DecodeOnionAddressV3(utils::base32Encode(raw)), HsException);
}

TEST(OnionAddressTest, GeneratedKeyRoundTrip)
{
    auto key = Ed25519KeyMaterial(crypto::Ed25519AsymmKey::generate());
    auto address = CalcOnionAddress(key);
    ASSERT_EQ(DecodeOnionAddressV3(address), key.publicBytes());
}

TEST(OnionAddressTest, PublicKeyOfWrongSize)
{
    std::vector<uint8_t> publicKey(33, 0x01);
    ASSERT_THROW(Ed25519KeyMaterial::fromPublicBytes(publicKey), HsException);
}
