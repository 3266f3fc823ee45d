#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace onionid::utils
{

std::string hexlify(std::span<const uint8_t> in);

std::vector<uint8_t> unhexlify(std::string_view in);

} // namespace onionid::utils
