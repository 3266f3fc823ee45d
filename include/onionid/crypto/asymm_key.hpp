#pragma once
#include <string_view>
#include <openssl/pem.h>
#include <onionid/crypto/pointers.hpp>

namespace onionid::crypto
{

class AsymmKey
{
public:
    static KeyPtr shallowCopy(Key* key);

    static bool isAlgorithm(const Key* key, std::string_view alg);

    static int getBits(const Key* key);

    /// @brief Parses a key from @p in.
    ///
    /// @param[in] passwordCb callback invoked by the PEM reader when the
    /// input is encrypted, may be nullptr.
    /// @param[in] data user data passed to @p passwordCb.
    ///
    /// @return parsed key or nullptr, the reason stays in the error queue.
    ///
    static KeyPtr fromBio(KeyType keyType, Bio* in, Encoding inEncoding, pem_password_cb* passwordCb = nullptr,
                          void* data = nullptr);

    static void toBio(KeyType keyType, Key* key, Bio* bio, Encoding encoding = Encoding::PEM);

    /// @brief Writes a private key as a legacy PEM block encrypted with
    /// @p cipher, which carries a "Proc-Type: 4,ENCRYPTED" header.
    static void toEncryptedBio(Key* key, Bio* bio, std::string_view cipher, std::string_view passphrase);
};

} // namespace onionid::crypto
