#pragma once
#include <string_view>
#include <vector>

namespace onionid::cmd
{

/// @brief Subcommand of the command line tool, receives arguments after its name.
class Command
{
public:
    Command() = default;

    virtual ~Command() = default;

    Command(const Command& other) = delete;
    Command& operator=(const Command& other) = delete;

    virtual void execute(const std::vector<std::string_view>& args) = 0;
};

} // namespace onionid::cmd
