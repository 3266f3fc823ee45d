#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <onionid/crypto/rsa_asymm_key.hpp>
#include <onionid/crypto/exception.hpp>
#include <onionid/crypto/crypto_manager.hpp>

namespace onionid::crypto
{

KeyPtr RsaAsymmKey::generate(size_t bits)
{
    EVP_PKEY* pkey{nullptr};
    crypto::KeyCtxPtr ctx{CryptoManager::getInstance().createKeyContext("RSA")};
    crypto::ThrowIfFalse(0 < EVP_PKEY_keygen_init(ctx));
    crypto::ThrowIfFalse(0 < EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, static_cast<int>(bits)));
    crypto::ThrowIfFalse(0 < EVP_PKEY_keygen(ctx, &pkey));
    return crypto::KeyPtr{pkey};
}

KeyPtr RsaAsymmKey::fromComponents(const BigNum* modulus, const BigNum* exponent)
{
    ParamBldPtr builder{OSSL_PARAM_BLD_new()};
    crypto::ThrowIfTrue(builder == nullptr, "bad alloc");
    crypto::ThrowIfFalse(0 < OSSL_PARAM_BLD_push_BN(builder, OSSL_PKEY_PARAM_RSA_N, modulus));
    crypto::ThrowIfFalse(0 < OSSL_PARAM_BLD_push_BN(builder, OSSL_PKEY_PARAM_RSA_E, exponent));

    ParamPtr params{OSSL_PARAM_BLD_to_param(builder)};
    crypto::ThrowIfTrue(params == nullptr);

    auto ctx = CryptoManager::getInstance().createKeyContext("RSA");
    crypto::ThrowIfFalse(0 < EVP_PKEY_fromdata_init(ctx));

    EVP_PKEY* pkey{nullptr};
    crypto::ThrowIfFalse(0 < EVP_PKEY_fromdata(ctx, &pkey, EVP_PKEY_PUBLIC_KEY, params), "invalid RSA components");
    return crypto::KeyPtr{pkey};
}

BigNumPtr RsaAsymmKey::getModulus(const Key* key)
{
    BIGNUM* n{nullptr};
    crypto::ThrowIfFalse(0 < EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_N, &n));
    return BigNumPtr{n};
}

BigNumPtr RsaAsymmKey::getExponent(const Key* key)
{
    BIGNUM* e{nullptr};
    crypto::ThrowIfFalse(0 < EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_E, &e));
    return BigNumPtr{e};
}

bool RsaAsymmKey::hasPrivate(const Key* key)
{
    BIGNUM* d{nullptr};
    if (0 < EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_D, &d))
    {
        BN_clear_free(d);
        return true;
    }
    ERR_clear_error();
    return false;
}

std::vector<uint8_t> RsaAsymmKey::encodePublicSequence(const Key* key)
{
    crypto::ThrowIfFalse(EVP_PKEY_is_a(key, "RSA"), "RSA key expected");

    int length = i2d_PublicKey(key, nullptr);
    crypto::ThrowIfFalse(0 < length);

    std::vector<uint8_t> encoded(length);
    auto ptr = encoded.data();
    crypto::ThrowIfFalse(0 < i2d_PublicKey(key, &ptr));

    return encoded;
}

} // namespace onionid::crypto
