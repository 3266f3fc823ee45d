#pragma once
#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <onionid/cli/command.hpp>
#include <onionid/utils/singleton.hpp>

namespace onionid::cmd
{

/// @brief Registry of subcommands, filled by REGISTER_COMMAND before main() runs.
class CommandDispatcher final : public utils::Singleton<CommandDispatcher>
{
public:
    using CommandPtr = std::unique_ptr<Command>;
    using CommandCreator = std::function<CommandPtr()>;

    CommandDispatcher() = default;
    ~CommandDispatcher() = default;

    /// @throw std::runtime_error if no command is registered as @p name.
    CommandPtr createCommand(const std::string& name) const;

    void printCommands(std::ostream& os) const;

    class Registrar final
    {
    public:
        Registrar(const std::string& name, const std::string& description, const CommandCreator& creator);
        ~Registrar() = default;
    };

private:
    void addCommand(const std::string& name, const std::string& description, const CommandCreator& creator);

    struct CommandMeta
    {
        std::string description;
        CommandCreator creator;
    };

    std::map<std::string, CommandMeta> commands_;
};

#define REGISTER_COMMAND(commandName, commandDesc, className)                                                          \
    const onionid::cmd::CommandDispatcher::Registrar className##Registrar(                                             \
        commandName, commandDesc, []() -> std::unique_ptr<onionid::cmd::Command> {                                    \
            return std::make_unique<className>();                                                                      \
        })

} // namespace onionid::cmd
