#include <string>
#include <onionid/crypto/crypto_manager.hpp>
#include <onionid/crypto/exception.hpp>

namespace onionid::crypto
{

CryptoManager& CryptoManager::getInstance()
{
    static CryptoManager instance;
    return instance;
}

HashPtr CryptoManager::fetchDigest(std::string_view algorithm)
{
    auto digest = HashPtr(EVP_MD_fetch(libctx_, std::string(algorithm).c_str(), nullptr));
    ThrowIfTrue(digest == nullptr);
    return digest;
}

KeyCtxPtr CryptoManager::createKeyContext(std::string_view algorithm)
{
    auto ctx = KeyCtxPtr(EVP_PKEY_CTX_new_from_name(libctx_, std::string(algorithm).c_str(), nullptr));
    ThrowIfTrue(ctx == nullptr);
    return ctx;
}

} // namespace onionid::crypto
