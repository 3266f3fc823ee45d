#pragma once
#include <string_view>

namespace onionid::log
{

static constexpr std::string_view resetColor{"\x1B[0m"};

static constexpr std::string_view bRed{"\x1B[1;31m"};
static constexpr std::string_view bYellow{"\x1B[1;33m"};
static constexpr std::string_view bCyan{"\x1B[1;36m"};
static constexpr std::string_view bWhite{"\x1B[1;37m"};

} // namespace onionid::log
