#pragma once
#include <string_view>

namespace onionid::log
{

enum class Level
{
    Emergency,
    Alert,
    Critical,
    Error,
    Warning,
    Notice,
    Info,
    Debug
};

/// @brief Log sink.
class Logger
{
public:
    Logger() = default;
    virtual ~Logger() = default;

    virtual void write(Level level, std::string_view msg) = 0;
};

} // namespace onionid::log
