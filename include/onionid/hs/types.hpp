#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace onionid::hs
{

constexpr size_t kKeyDigestSize{20};
constexpr size_t kPermanentIdSize{10};
constexpr size_t kDescriptorCookieSize{16};
constexpr size_t kPaddedMessageSize{128};

/// SHA-1 of the DER encoded RSA public key.
using KeyDigest = std::array<uint8_t, kKeyDigestSize>;

/// Leading bytes of KeyDigest naming a v2 service.
using PermanentId = std::array<uint8_t, kPermanentIdSize>;

using SecretIdPart = std::array<uint8_t, kKeyDigestSize>;

using DescriptorId = std::array<uint8_t, kKeyDigestSize>;

using DescriptorCookie = std::array<uint8_t, kDescriptorCookieSize>;

using PaddedMessage = std::array<uint8_t, kPaddedMessageSize>;

} // namespace onionid::hs
