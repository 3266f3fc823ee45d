#include <cstdlib>
#include <iostream>
#include <onionid/cli/command_dispatcher.hpp>
#include <onionid/log/log_manager.hpp>
#include <onionid/utils/string.hpp>

using namespace onionid;

namespace
{

void PrintUsage(std::ostream& os)
{
    os << "Usage: onionid <command> [options]\n\n";
    os << "Commands:\n";
    cmd::CommandDispatcher::Instance().printCommands(os);
    os << "Use 'onionid <command> --help' for command options" << std::endl;
}

} // namespace

int main(int argc, char* argv[])
{
    std::vector<std::string_view> args(argv + 1, argv + argc);
    if (args.empty())
    {
        PrintUsage(std::cerr);
        return EXIT_FAILURE;
    }

    const auto name = args.front();
    if (utils::equals(name, "-h") || utils::equals(name, "--help"))
    {
        PrintUsage(std::cout);
        return EXIT_SUCCESS;
    }
    args.erase(args.begin());

    log::LogManager::Instance().enable(log::Type::Console);

    try
    {
        auto command = cmd::CommandDispatcher::Instance().createCommand(std::string(name));
        command->execute(args);
    }
    catch (const std::system_error& e)
    {
        log::error("{} [{}]", e.what(), e.code());
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        log::error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
