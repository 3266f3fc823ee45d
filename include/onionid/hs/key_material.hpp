#pragma once
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

#include <onionid/crypto/pointers.hpp>
#include <onionid/crypto/ed25519_asymm_key.hpp>

namespace onionid::hs
{

enum class AddressVersion : uint8_t
{
    V2 = 2, ///< Legacy RSA-1024 service.
    V3 = 3, ///< Ed25519 service.
};

/// @brief RSA key of a v2 service, public or private.
class RsaKeyMaterial final
{
public:
    /// @throw HsException with Error::KeyFormat if @p key is not an RSA key.
    explicit RsaKeyMaterial(crypto::KeyPtr key);

    static RsaKeyMaterial fromComponents(const BigNum* modulus, const BigNum* exponent);

    RsaKeyMaterial(const RsaKeyMaterial& other);
    RsaKeyMaterial& operator=(const RsaKeyMaterial& other);

    RsaKeyMaterial(RsaKeyMaterial&& other) noexcept = default;
    RsaKeyMaterial& operator=(RsaKeyMaterial&& other) noexcept = default;

    ~RsaKeyMaterial() = default;

    const Key* get() const noexcept
    {
        return key_.get();
    }

    /// @brief DER sequence of modulus and public exponent.
    std::vector<uint8_t> publicBytes() const;

    static constexpr AddressVersion addressVersion() noexcept
    {
        return AddressVersion::V2;
    }

private:
    crypto::KeyPtr key_;
};

/// @brief Ed25519 key of a v3 service, public or private.
class Ed25519KeyMaterial final
{
public:
    using RawKey = crypto::Ed25519AsymmKey::RawKey;

    /// @throw HsException with Error::KeyFormat if @p key is not an Ed25519 key.
    explicit Ed25519KeyMaterial(crypto::KeyPtr key);

    static Ed25519KeyMaterial fromPublicBytes(std::span<const uint8_t> publicKey);

    Ed25519KeyMaterial(const Ed25519KeyMaterial& other);
    Ed25519KeyMaterial& operator=(const Ed25519KeyMaterial& other);

    Ed25519KeyMaterial(Ed25519KeyMaterial&& other) noexcept = default;
    Ed25519KeyMaterial& operator=(Ed25519KeyMaterial&& other) noexcept = default;

    ~Ed25519KeyMaterial() = default;

    const Key* get() const noexcept
    {
        return key_.get();
    }

    const RawKey& publicBytes() const noexcept
    {
        return publicKey_;
    }

    static constexpr AddressVersion addressVersion() noexcept
    {
        return AddressVersion::V3;
    }

private:
    crypto::KeyPtr key_;
    RawKey publicKey_;
};

using KeyMaterial = std::variant<RsaKeyMaterial, Ed25519KeyMaterial>;

/// @brief Wraps a parsed key into the material matching its algorithm.
///
/// @throw HsException with Error::KeyFormat for keys that are neither RSA nor Ed25519.
///
KeyMaterial MakeKeyMaterial(crypto::KeyPtr key);

AddressVersion GetAddressVersion(const KeyMaterial& material) noexcept;

} // namespace onionid::hs
