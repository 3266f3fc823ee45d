#pragma once
#include <cstdint>
#include <vector>
#include <onionid/crypto/pointers.hpp>

namespace onionid::crypto
{

class RsaAsymmKey final
{
public:
    static KeyPtr generate(size_t bits);

    /// @brief Builds a public key from its modulus and public exponent.
    static KeyPtr fromComponents(const BigNum* modulus, const BigNum* exponent);

    static BigNumPtr getModulus(const Key* key);

    static BigNumPtr getExponent(const Key* key);

    static bool hasPrivate(const Key* key);

    /// @brief DER encoding of SEQUENCE { modulus INTEGER, exponent INTEGER }.
    static std::vector<uint8_t> encodePublicSequence(const Key* key);
};

} // namespace onionid::crypto
