#include <string>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <onionid/crypto/asymm_key.hpp>
#include <onionid/crypto/exception.hpp>
#include <onionid/crypto/error_code.hpp>

namespace onionid::crypto
{

KeyPtr AsymmKey::shallowCopy(Key* key)
{
    if (key)
    {
        crypto::ThrowIfFalse(0 < EVP_PKEY_up_ref(key));
        return KeyPtr{key};
    }
    return nullptr;
}

bool AsymmKey::isAlgorithm(const Key* key, std::string_view alg)
{
    return EVP_PKEY_is_a(key, std::string(alg).c_str());
}

int AsymmKey::getBits(const Key* key)
{
    return EVP_PKEY_get_bits(key);
}

KeyPtr AsymmKey::fromBio(KeyType keyType, Bio* in, Encoding inEncoding, pem_password_cb* passwordCb, void* data)
{
    KeyPtr result;

    switch (inEncoding)
    {
    case Encoding::DER:
    {
        if (keyType == KeyType::Public)
        {
            result.reset(d2i_PUBKEY_bio(in, nullptr));
        }
        else
        {
            result.reset(d2i_PrivateKey_bio(in, nullptr));
        }
    }
    break;

    case Encoding::PEM:
    {
        if (keyType == KeyType::Public)
        {
            result.reset(PEM_read_bio_PUBKEY(in, nullptr, passwordCb, data));
        }
        else
        {
            result.reset(PEM_read_bio_PrivateKey(in, nullptr, passwordCb, data));
        }
    }
    break;

    default:
    {
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "Unsupported key encoding");
    }
    break;
    }

    return result;
}

void AsymmKey::toBio(KeyType keyType, Key* key, Bio* bio, Encoding encoding)
{
    int ret{0};

    switch (encoding)
    {
    case Encoding::DER:
    {
        if (keyType == KeyType::Public)
        {
            ret = i2d_PUBKEY_bio(bio, key);
        }
        else
        {
            ret = i2d_PrivateKey_bio(bio, key);
        }
    }
    break;

    case Encoding::PEM:
    {
        if (keyType == KeyType::Public)
        {
            ret = PEM_write_bio_PUBKEY(bio, key);
        }
        else
        {
            ret = PEM_write_bio_PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr);
        }
    }
    break;

    default:
    {
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "Unsupported encoding");
    }
    break;
    }

    if (!ret)
    {
        throw CryptoException(GetLastError(), "Failed to save key");
    }
}

void AsymmKey::toEncryptedBio(Key* key, Bio* bio, std::string_view cipher, std::string_view passphrase)
{
    const EVP_CIPHER* algorithm = EVP_get_cipherbyname(std::string(cipher).c_str());
    ThrowIfTrue(algorithm == nullptr, "Unknown cipher");

    auto pass = reinterpret_cast<unsigned char*>(const_cast<char*>(passphrase.data()));
    ThrowIfFalse(0 < PEM_write_bio_PrivateKey_traditional(bio, key, algorithm, pass,
                                                          static_cast<int>(passphrase.size()), nullptr, nullptr),
                 "Failed to save key");
}

} // namespace onionid::crypto
