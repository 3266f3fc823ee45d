#include <onionid/crypto/ed25519_asymm_key.hpp>
#include <onionid/crypto/exception.hpp>
#include <onionid/crypto/crypto_manager.hpp>

namespace onionid::crypto
{

KeyPtr Ed25519AsymmKey::generate()
{
    EVP_PKEY* pkey{nullptr};
    auto ctx = CryptoManager::getInstance().createKeyContext("ED25519");
    crypto::ThrowIfFalse(0 < EVP_PKEY_keygen_init(ctx));
    crypto::ThrowIfFalse(0 < EVP_PKEY_keygen(ctx, &pkey));
    return crypto::KeyPtr{pkey};
}

KeyPtr Ed25519AsymmKey::fromPrivateBytes(std::span<const uint8_t> secret)
{
    crypto::ThrowIfTrue(secret.size() != kKeySize, "invalid Ed25519 private key length");

    KeyPtr key{EVP_PKEY_new_raw_private_key_ex(nullptr, "ED25519", nullptr, secret.data(), secret.size())};
    crypto::ThrowIfTrue(key == nullptr);
    return key;
}

KeyPtr Ed25519AsymmKey::fromPublicBytes(std::span<const uint8_t> publicKey)
{
    crypto::ThrowIfTrue(publicKey.size() != kKeySize, "invalid Ed25519 public key length");

    KeyPtr key{EVP_PKEY_new_raw_public_key_ex(nullptr, "ED25519", nullptr, publicKey.data(), publicKey.size())};
    crypto::ThrowIfTrue(key == nullptr);
    return key;
}

Ed25519AsymmKey::RawKey Ed25519AsymmKey::getPublicBytes(const Key* key)
{
    RawKey publicKey{};
    size_t length = publicKey.size();
    crypto::ThrowIfFalse(0 < EVP_PKEY_get_raw_public_key(key, publicKey.data(), &length));
    crypto::ThrowIfFalse(length == publicKey.size(), "unexpected Ed25519 public key length");
    return publicKey;
}

} // namespace onionid::crypto
