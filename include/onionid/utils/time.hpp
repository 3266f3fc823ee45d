#pragma once
#include <ctime>
#include <string>

namespace onionid::utils
{

/// @brief Formats @p timestamp in UTC, rounded down to the hour, as
/// "%Y-%m-%d %H:%M:%S".
std::string roundedTimestamp(std::time_t timestamp);

/// @brief Same for the current time.
std::string roundedTimestamp();

} // namespace onionid::utils
