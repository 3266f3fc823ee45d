#pragma once
#include <cstdint>
#include <span>
#include <onionid/hs/types.hpp>

namespace onionid::hs
{

constexpr size_t kMaxPkcs1MessageSize{kPaddedMessageSize - 3};

/// @brief Builds 0x00 0x01 | 0xFF... | 0x00 | message, 128 bytes in total.
///
/// @throw HsException with Error::InvalidEncoding if @p message is longer than
/// kMaxPkcs1MessageSize bytes.
///
PaddedMessage AddPkcs1Padding(std::span<const uint8_t> message);

} // namespace onionid::hs
