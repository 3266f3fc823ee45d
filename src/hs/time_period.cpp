#include <limits>
#include <onionid/hs/time_period.hpp>
#include <onionid/utils/exception.hpp>

namespace onionid::hs
{

namespace
{

uint64_t ShiftTimestamp(uint64_t timestamp, const PermanentId& permanentId)
{
    const auto offset = GetTimePeriodOffset(permanentId);
    utils::ThrowIfTrue(timestamp > std::numeric_limits<uint64_t>::max() - offset, "timestamp out of range");
    return timestamp + offset;
}

} // namespace

uint64_t GetTimePeriodOffset(const PermanentId& permanentId) noexcept
{
    const uint64_t phase = permanentId[0];
    return phase * kTimePeriodLength / 256;
}

uint32_t GetTimePeriod(uint64_t timestamp, const PermanentId& permanentId, int64_t deviation)
{
    // At most 2^64 / 86400, so the bounds below fit int64_t.
    const auto base = static_cast<int64_t>(ShiftTimestamp(timestamp, permanentId) / kTimePeriodLength);
    const int64_t maxPeriod = std::numeric_limits<uint32_t>::max();

    utils::ThrowIfTrue(deviation < -base || deviation > maxPeriod - base, "time period out of range");
    return static_cast<uint32_t>(base + deviation);
}

uint32_t GetSecondsValid(uint64_t timestamp, const PermanentId& permanentId)
{
    const auto shifted = ShiftTimestamp(timestamp, permanentId);
    return static_cast<uint32_t>(kTimePeriodLength - shifted % kTimePeriodLength);
}

} // namespace onionid::hs
