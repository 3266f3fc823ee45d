#include <algorithm>
#include <onionid/hs/onion_address.hpp>
#include <onionid/hs/error.hpp>

#include <onionid/hs/key_digest.hpp>
#include <onionid/crypto/message_digest.hpp>
#include <onionid/utils/base32.hpp>

namespace onionid::hs
{

namespace
{

using RawKey = Ed25519KeyMaterial::RawKey;

// public key | checksum | version
constexpr size_t kOnionAddressV3Size{crypto::Ed25519AsymmKey::kKeySize + kOnionChecksumSize + 1};

std::vector<uint8_t> DecodeAddress(std::string_view address, size_t expectedSize)
{
    auto decoded = utils::base32Decode(address);
    ThrowIfTrue(!decoded.has_value(), Error::InvalidEncoding, "onion address is not base32");
    ThrowIfTrue(decoded->size() != expectedSize, Error::InvalidEncoding, "unexpected onion address length");
    return std::move(decoded.value());
}

} // namespace

std::string CalcOnionAddress(const KeyMaterial& key)
{
    return std::visit([](const auto& material) { return CalcOnionAddress(material); }, key);
}

std::string CalcOnionAddress(const RsaKeyMaterial& key)
{
    return EncodeOnionAddressV2(CalcPermanentId(key));
}

std::string CalcOnionAddress(const Ed25519KeyMaterial& key)
{
    return EncodeOnionAddressV3(key.publicBytes());
}

std::string EncodeOnionAddressV2(const PermanentId& permanentId)
{
    return utils::base32Encode(permanentId);
}

std::string EncodeOnionAddressV3(const RawKey& publicKey)
{
    auto checksum = CalcOnionChecksum(publicKey, kOnionAddressVersion);

    std::array<uint8_t, kOnionAddressV3Size> address{};
    auto it = std::copy(publicKey.begin(), publicKey.end(), address.begin());
    it = std::copy(checksum.begin(), checksum.end(), it);
    *it = kOnionAddressVersion;

    return utils::base32Encode(address);
}

OnionChecksum CalcOnionChecksum(const RawKey& publicKey, uint8_t version)
{
    crypto::MessageDigest sha3("SHA3-256");
    sha3.update(kOnionChecksumPrefix);
    sha3.update(publicKey);
    sha3.update(std::span<const uint8_t>(&version, 1));
    auto digest = sha3.final();

    OnionChecksum checksum{};
    std::copy_n(digest.begin(), checksum.size(), checksum.begin());
    return checksum;
}

PermanentId DecodeOnionAddress(std::string_view address)
{
    auto decoded = DecodeAddress(address, kPermanentIdSize);

    PermanentId permanentId{};
    std::copy(decoded.begin(), decoded.end(), permanentId.begin());
    return permanentId;
}

RawKey DecodeOnionAddressV3(std::string_view address)
{
    auto decoded = DecodeAddress(address, kOnionAddressV3Size);

    RawKey publicKey{};
    std::copy_n(decoded.begin(), publicKey.size(), publicKey.begin());

    const uint8_t version = decoded.back();
    ThrowIfTrue(version != kOnionAddressVersion, Error::InvalidEncoding, "unsupported onion address version");

    auto checksum = CalcOnionChecksum(publicKey, version);
    ThrowIfTrue(!std::equal(checksum.begin(), checksum.end(), decoded.begin() + publicKey.size()),
                Error::InvalidEncoding, "onion address checksum mismatch");

    return publicKey;
}

} // namespace onionid::hs
