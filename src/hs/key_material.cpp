#include <onionid/hs/key_material.hpp>
#include <onionid/hs/error.hpp>

#include <onionid/crypto/asymm_key.hpp>
#include <onionid/crypto/rsa_asymm_key.hpp>

namespace onionid::hs
{

RsaKeyMaterial::RsaKeyMaterial(crypto::KeyPtr key)
    : key_(std::move(key))
{
    ThrowIfTrue(key_ == nullptr || !crypto::AsymmKey::isAlgorithm(key_, "RSA"), Error::KeyFormat,
                "RSA key expected");
}

RsaKeyMaterial RsaKeyMaterial::fromComponents(const BigNum* modulus, const BigNum* exponent)
{
    return RsaKeyMaterial(crypto::RsaAsymmKey::fromComponents(modulus, exponent));
}

RsaKeyMaterial::RsaKeyMaterial(const RsaKeyMaterial& other)
    : key_(crypto::AsymmKey::shallowCopy(other.key_))
{
}

RsaKeyMaterial& RsaKeyMaterial::operator=(const RsaKeyMaterial& other)
{
    if (this != &other)
    {
        key_ = crypto::AsymmKey::shallowCopy(other.key_);
    }
    return *this;
}

std::vector<uint8_t> RsaKeyMaterial::publicBytes() const
{
    return crypto::RsaAsymmKey::encodePublicSequence(key_);
}

Ed25519KeyMaterial::Ed25519KeyMaterial(crypto::KeyPtr key)
    : key_(std::move(key))
{
    ThrowIfTrue(key_ == nullptr || !crypto::AsymmKey::isAlgorithm(key_, "ED25519"), Error::KeyFormat,
                "Ed25519 key expected");
    publicKey_ = crypto::Ed25519AsymmKey::getPublicBytes(key_);
}

Ed25519KeyMaterial Ed25519KeyMaterial::fromPublicBytes(std::span<const uint8_t> publicKey)
{
    ThrowIfTrue(publicKey.size() != crypto::Ed25519AsymmKey::kKeySize, Error::InvalidEncoding,
                "Ed25519 public key must be 32 bytes");
    return Ed25519KeyMaterial(crypto::Ed25519AsymmKey::fromPublicBytes(publicKey));
}

Ed25519KeyMaterial::Ed25519KeyMaterial(const Ed25519KeyMaterial& other)
    : key_(crypto::AsymmKey::shallowCopy(other.key_))
    , publicKey_(other.publicKey_)
{
}

Ed25519KeyMaterial& Ed25519KeyMaterial::operator=(const Ed25519KeyMaterial& other)
{
    if (this != &other)
    {
        key_ = crypto::AsymmKey::shallowCopy(other.key_);
        publicKey_ = other.publicKey_;
    }
    return *this;
}

KeyMaterial MakeKeyMaterial(crypto::KeyPtr key)
{
    ThrowIfTrue(key == nullptr, Error::KeyFormat, "no key");

    if (crypto::AsymmKey::isAlgorithm(key, "RSA"))
    {
        return RsaKeyMaterial(std::move(key));
    }
    if (crypto::AsymmKey::isAlgorithm(key, "ED25519"))
    {
        return Ed25519KeyMaterial(std::move(key));
    }

    throw HsException(MakeErrorCode(Error::KeyFormat), "unsupported key algorithm");
}

AddressVersion GetAddressVersion(const KeyMaterial& material) noexcept
{
    return std::visit([](const auto& key) { return key.addressVersion(); }, material);
}

} // namespace onionid::hs
