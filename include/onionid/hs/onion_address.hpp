#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <onionid/hs/types.hpp>
#include <onionid/hs/key_material.hpp>

namespace onionid::hs
{

constexpr std::string_view kOnionChecksumPrefix{".onion checksum"};
constexpr uint8_t kOnionAddressVersion{0x03};
constexpr size_t kOnionChecksumSize{2};

constexpr size_t kOnionAddressV2Length{16};
constexpr size_t kOnionAddressV3Length{56};

using OnionChecksum = std::array<uint8_t, kOnionChecksumSize>;

/// @brief Onion address of a service, v2 for RSA and v3 for Ed25519 keys.
std::string CalcOnionAddress(const KeyMaterial& key);

std::string CalcOnionAddress(const RsaKeyMaterial& key);

std::string CalcOnionAddress(const Ed25519KeyMaterial& key);

std::string EncodeOnionAddressV2(const PermanentId& permanentId);

std::string EncodeOnionAddressV3(const Ed25519KeyMaterial::RawKey& publicKey);

/// @brief First two bytes of SHA3-256(".onion checksum" | publicKey | version).
OnionChecksum CalcOnionChecksum(const Ed25519KeyMaterial::RawKey& publicKey, uint8_t version);

/// @brief Decodes a v2 address back to the permanent ID, ignoring case.
///
/// @throw HsException with Error::InvalidEncoding if @p address is not base32
/// or does not hold exactly kPermanentIdSize bytes.
///
PermanentId DecodeOnionAddress(std::string_view address);

/// @brief Decodes a v3 address, checking its version byte and checksum.
///
/// @throw HsException with Error::InvalidEncoding on any mismatch.
///
Ed25519KeyMaterial::RawKey DecodeOnionAddressV3(std::string_view address);

} // namespace onionid::hs
