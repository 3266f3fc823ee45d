#include <chrono>
#include <onionid/utils/time.hpp>
#include <onionid/utils/exception.hpp>

namespace onionid::utils
{

std::string roundedTimestamp(std::time_t timestamp)
{
    std::tm utc{};
    ThrowIfTrue(gmtime_r(&timestamp, &utc) == nullptr, "timestamp out of range");

    utc.tm_min = 0;
    utc.tm_sec = 0;

    char buffer[32];
    auto length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &utc);
    ThrowIfTrue(length == 0, "unable to format timestamp");

    return std::string(buffer, length);
}

std::string roundedTimestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return roundedTimestamp(now);
}

} // namespace onionid::utils
