#include <iostream>

#include <onionid/cli/command_dispatcher.hpp>
#include <onionid/opt/option_parser.hpp>
#include <onionid/log/log_manager.hpp>

#include <onionid/hs/key_loader.hpp>
#include <onionid/hs/onion_address.hpp>

namespace onionid::address
{

struct Options
{
    std::string keyPath;
    size_t retries{hs::KeyLoader::kDefaultRetries};
};

class Command final : public cmd::Command
{
public:
    Command()
    {
        parser_.add("help, h", "Print help message");
        parser_.add("key, k", opt::Value(&options_.keyPath), "Path to the service private key").setRequired();
        parser_.add("retries", opt::Value(&options_.retries), "Passphrase attempts for encrypted keys")
            .setDefaultValue(hs::KeyLoader::kDefaultRetries);
        parser_.add("verbose, v", "Print debug messages");
    }

    ~Command() = default;

    void execute(const std::vector<std::string_view>& args) override
    {
        parser_.parse(args);
        if (parser_.isUsed("help"))
        {
            parser_.help(std::cout, "address");
            return;
        }
        parser_.validate();

        if (parser_.isUsed("verbose"))
        {
            log::LogManager::Instance().setLevel(log::Level::Debug);
        }

        hs::KeyLoader loader(hs::TerminalPassphraseSource(), options_.retries);
        auto key = loader.loadFromFile(options_.keyPath);

        log::info("Loaded v{} service key from '{}'", static_cast<int>(hs::GetAddressVersion(key)),
                  options_.keyPath);
        std::cout << hs::CalcOnionAddress(key) << ".onion" << std::endl;
    }

private:
    opt::OptionParser parser_;
    Options options_;
};

REGISTER_COMMAND("address", "Print the onion address of a service key", Command);

} // namespace onionid::address
