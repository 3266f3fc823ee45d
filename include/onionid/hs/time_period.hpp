/// @file
/// @brief Rotation of v2 descriptor identifiers.
///
/// A time period lasts one day. Its start is shifted for every service by
/// (first byte of the permanent ID) / 256 of a day, so that services do not
/// rotate their descriptors at the same moment.

#pragma once
#include <cstdint>
#include <onionid/hs/types.hpp>

namespace onionid::hs
{

constexpr uint64_t kTimePeriodLength{86400};

/// @brief Per-service offset in seconds, (phase * 86400 / 256) truncated.
uint64_t GetTimePeriodOffset(const PermanentId& permanentId) noexcept;

/// @brief Index of the period containing @p timestamp, moved by @p deviation periods.
///
/// @throw utils::RuntimeError if @p timestamp plus the offset overflows, or
/// if the resulting period does not fit 32 bits.
///
uint32_t GetTimePeriod(uint64_t timestamp, const PermanentId& permanentId, int64_t deviation = 0);

/// @brief Seconds left until the period containing @p timestamp ends, in [1, 86400].
///
/// @throw utils::RuntimeError if @p timestamp plus the offset overflows.
///
uint32_t GetSecondsValid(uint64_t timestamp, const PermanentId& permanentId);

} // namespace onionid::hs
