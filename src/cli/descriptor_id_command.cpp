#include <ctime>
#include <iostream>

#include <onionid/cli/command_dispatcher.hpp>
#include <onionid/opt/option_parser.hpp>
#include <onionid/log/log_manager.hpp>

#include <onionid/hs/descriptor_id.hpp>
#include <onionid/utils/exception.hpp>
#include <onionid/utils/hexlify.hpp>
#include <onionid/utils/time.hpp>

namespace onionid::descriptor
{

struct Options
{
    std::string address;
    std::string cookie;
    uint64_t time{0};
    unsigned int replica{0};
    int64_t deviation{0};
};

class Command final : public cmd::Command
{
public:
    Command()
    {
        parser_.add("help, h", "Print help message");
        parser_.add("address, a", opt::Value(&options_.address), "Onion address (v2) of the service").setRequired();
        parser_.add("time, t", opt::Value(&options_.time), "Seconds since the epoch, current time by default");
        parser_.add("replica, r", opt::Value(&options_.replica), "Descriptor replica index");
        parser_.add("deviation, d", opt::Value(&options_.deviation), "Time periods to move from the current one");
        parser_.add("cookie, c", opt::Value(&options_.cookie), "Descriptor cookie in hex");
        parser_.add("verbose, v", "Print debug messages");
    }

    ~Command() = default;

    void execute(const std::vector<std::string_view>& args) override
    {
        parser_.parse(args);
        if (parser_.isUsed("help"))
        {
            parser_.help(std::cout, "descriptor-id");
            return;
        }
        parser_.validate();

        if (parser_.isUsed("verbose"))
        {
            log::LogManager::Instance().setLevel(log::Level::Debug);
        }

        if (!parser_.isUsed("time"))
        {
            options_.time = static_cast<uint64_t>(std::time(nullptr));
        }

        utils::ThrowIfTrue(options_.replica > 0xFF, "replica must fit one byte");

        auto address = std::string_view(options_.address);
        if (address.ends_with(".onion"))
        {
            address.remove_suffix(6);
        }

        auto cookie = utils::unhexlify(options_.cookie);

        log::debug("Computing descriptor ID for '{}' at {}", address,
                   utils::roundedTimestamp(static_cast<std::time_t>(options_.time)));

        auto lookup = hs::CalcDescriptorLookup(address, options_.time, static_cast<uint8_t>(options_.replica),
                                               options_.deviation, cookie);

        std::cout << "descriptor-id: " << lookup.descriptorId << std::endl;
        std::cout << "time-period:   " << lookup.timePeriod << std::endl;
        std::cout << "seconds-valid: " << lookup.secondsValid << std::endl;
    }

private:
    opt::OptionParser parser_;
    Options options_;
};

REGISTER_COMMAND("descriptor-id", "Compute the descriptor ID of a v2 service", Command);

} // namespace onionid::descriptor
