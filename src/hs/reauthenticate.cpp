#include <thread>
#include <onionid/hs/reauthenticate.hpp>
#include <onionid/utils/format.hpp>

namespace onionid::hs
{

bool Reauthenticate(ControlChannel& channel, const ReauthSettings& settings, log::Logger& logger)
{
    if (settings.delay.count() > 0)
    {
        std::this_thread::sleep_for(settings.delay);
    }

    std::error_code ec;
    channel.authenticate(settings.password, ec);
    if (ec)
    {
        logger.write(log::Level::Error, utils::format("Failed to re-authenticate controller: {}", ec.message()));
        return false;
    }

    return true;
}

} // namespace onionid::hs
