#pragma once
#include <onionid/log/logger.hpp>

namespace onionid::log
{

/// @brief Writes colored, timestamped lines. Errors and worse go to stderr.
class Console final : public Logger
{
public:
    Console() = default;

    ~Console() = default;

    void write(Level level, std::string_view msg) override;
};

} // namespace onionid::log
