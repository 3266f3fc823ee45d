#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace onionid::utils
{

/// @brief Encodes @p in with the RFC 4648 base32 alphabet.
///
/// Output is lowercase. Inputs whose length is not a multiple of 5 bytes are
/// padded with '=' up to a multiple of 8 characters.
///
std::string base32Encode(std::span<const uint8_t> in);

/// @brief Decodes RFC 4648 base32 text, ignoring letter case.
///
/// Trailing '=' padding is optional.
///
/// @return decoded bytes, or std::nullopt if @p in has a symbol outside the
/// alphabet or a length no byte sequence encodes to.
///
std::optional<std::vector<uint8_t>> base32Decode(std::string_view in);

} // namespace onionid::utils
