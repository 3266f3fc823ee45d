#pragma once
#include <string_view>
#include <onionid/crypto/pointers.hpp>

namespace onionid::crypto
{

/// @brief Fetches algorithm implementations from the default library context.
class CryptoManager final
{
private:
    CryptoManager() = default;

public:
    static CryptoManager& getInstance();

    ~CryptoManager() noexcept = default;

    CryptoManager(const CryptoManager& other) = delete;
    CryptoManager& operator=(const CryptoManager& other) = delete;

    HashPtr fetchDigest(std::string_view algorithm);

    KeyCtxPtr createKeyContext(std::string_view algorithm);

private:
    OSSL_LIB_CTX* libctx_{nullptr};
};

} // namespace onionid::crypto
