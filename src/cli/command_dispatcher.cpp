#include <algorithm>
#include <iomanip>
#include <stdexcept>
#include <onionid/cli/command_dispatcher.hpp>

namespace onionid::cmd
{

CommandDispatcher::CommandPtr CommandDispatcher::createCommand(const std::string& name) const
{
    auto it = commands_.find(name);
    if (it == commands_.end())
    {
        throw std::runtime_error("Unknown command '" + name + "', use '--help' to list commands");
    }
    return it->second.creator();
}

void CommandDispatcher::printCommands(std::ostream& os) const
{
    size_t width{0};
    for (const auto& entry : commands_)
    {
        width = std::max(width, entry.first.size());
    }

    for (const auto& [name, meta] : commands_)
    {
        os << "  " << std::left << std::setw(static_cast<int>(width + 4)) << name << meta.description << "\n";
    }
    os << std::endl;
}

void CommandDispatcher::addCommand(const std::string& name, const std::string& description,
                                   const CommandCreator& creator)
{
    auto [it, inserted] = commands_.emplace(name, CommandMeta{description, creator});
    if (!inserted)
    {
        throw std::logic_error("Duplicated command: " + name);
    }
}

CommandDispatcher::Registrar::Registrar(const std::string& name, const std::string& description,
                                        const CommandCreator& creator)
{
    CommandDispatcher::Instance().addCommand(name, description, creator);
}

} // namespace onionid::cmd
