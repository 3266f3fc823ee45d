#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <onionid/crypto/pointers.hpp>

namespace onionid::crypto
{

class Ed25519AsymmKey final
{
public:
    static constexpr size_t kKeySize{32};

    using RawKey = std::array<uint8_t, kKeySize>;

    static KeyPtr generate();

    static KeyPtr fromPrivateBytes(std::span<const uint8_t> secret);

    static KeyPtr fromPublicBytes(std::span<const uint8_t> publicKey);

    static RawKey getPublicBytes(const Key* key);
};

} // namespace onionid::crypto
