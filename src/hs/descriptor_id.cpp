#include <onionid/hs/descriptor_id.hpp>
#include <onionid/hs/error.hpp>
#include <onionid/hs/onion_address.hpp>
#include <onionid/hs/time_period.hpp>

#include <onionid/crypto/message_digest.hpp>
#include <onionid/utils/base32.hpp>
#include <onionid/utils/load_store.hpp>

namespace onionid::hs
{

SecretIdPart CalcSecretIdPart(uint32_t timePeriod, std::span<const uint8_t> cookie, uint8_t replica)
{
    ThrowIfTrue(!cookie.empty() && cookie.size() != kDescriptorCookieSize, Error::InvalidEncoding,
                "descriptor cookie must be 16 bytes");

    uint8_t period[sizeof(timePeriod)];
    utils::store_be(timePeriod, period);

    crypto::MessageDigest sha1("SHA1");
    sha1.update(period);
    if (!cookie.empty())
    {
        sha1.update(cookie);
    }
    sha1.update(std::span<const uint8_t>(&replica, 1));

    SecretIdPart secretIdPart{};
    sha1.final(secretIdPart);
    return secretIdPart;
}

DescriptorId CalcDescriptorId(const PermanentId& permanentId, const SecretIdPart& secretIdPart)
{
    DescriptorId descriptorId{};
    crypto::MessageDigest("SHA1").update(permanentId).update(secretIdPart).final(descriptorId);
    return descriptorId;
}

std::string CalcDescriptorIdB32(std::string_view onionAddress, uint64_t timestamp, uint8_t replica,
                                int64_t deviation, std::span<const uint8_t> cookie)
{
    return CalcDescriptorLookup(onionAddress, timestamp, replica, deviation, cookie).descriptorId;
}

DescriptorLookup CalcDescriptorLookup(std::string_view onionAddress, uint64_t timestamp, uint8_t replica,
                                      int64_t deviation, std::span<const uint8_t> cookie)
{
    auto permanentId = DecodeOnionAddress(onionAddress);
    auto timePeriod = GetTimePeriod(timestamp, permanentId, deviation);
    auto secretIdPart = CalcSecretIdPart(timePeriod, cookie, replica);
    auto descriptorId = CalcDescriptorId(permanentId, secretIdPart);

    return DescriptorLookup{utils::base32Encode(descriptorId), timePeriod, GetSecondsValid(timestamp, permanentId)};
}

} // namespace onionid::hs
