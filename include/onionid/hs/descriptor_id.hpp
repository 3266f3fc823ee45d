#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <onionid/hs/types.hpp>

namespace onionid::hs
{

/// @brief SHA-1(time period as 4 bytes big-endian | cookie | replica byte).
///
/// @param[in] cookie descriptor cookie, empty when the service has none.
///
/// @throw HsException with Error::InvalidEncoding if @p cookie is neither
/// empty nor kDescriptorCookieSize bytes long.
///
SecretIdPart CalcSecretIdPart(uint32_t timePeriod, std::span<const uint8_t> cookie, uint8_t replica);

/// @brief SHA-1(permanent ID | secret-id-part).
DescriptorId CalcDescriptorId(const PermanentId& permanentId, const SecretIdPart& secretIdPart);

/// @brief Descriptor ID of the service at @p onionAddress, base32 encoded.
///
/// @param[in] onionAddress v2 address, any letter case.
/// @param[in] timestamp seconds since the epoch.
/// @param[in] replica descriptor replica index.
/// @param[in] deviation number of periods to move away from the current one.
/// @param[in] cookie descriptor cookie, empty when the service has none.
///
std::string CalcDescriptorIdB32(std::string_view onionAddress, uint64_t timestamp, uint8_t replica,
                                int64_t deviation = 0, std::span<const uint8_t> cookie = {});

/// @brief Result of a descriptor lookup computation.
struct DescriptorLookup
{
    std::string descriptorId; ///< Base32 descriptor ID.
    uint32_t timePeriod;      ///< Period the ID belongs to, deviation included.
    uint32_t secondsValid;    ///< Seconds until the current period ends.
};

DescriptorLookup CalcDescriptorLookup(std::string_view onionAddress, uint64_t timestamp, uint8_t replica,
                                      int64_t deviation = 0, std::span<const uint8_t> cookie = {});

} // namespace onionid::hs
