#pragma once
#include <onionid/hs/types.hpp>
#include <onionid/hs/key_material.hpp>

namespace onionid::hs
{

/// @brief SHA-1 over the DER sequence (modulus, exponent) of an RSA key.
///
/// Any key size is accepted.
///
KeyDigest CalcKeyDigest(const RsaKeyMaterial& key);

/// @brief First ten bytes of CalcKeyDigest(), the v2 service identifier.
PermanentId CalcPermanentId(const RsaKeyMaterial& key);

} // namespace onionid::hs
