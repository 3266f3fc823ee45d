#pragma once
#include <chrono>
#include <string>

#include <onionid/hs/control_channel.hpp>
#include <onionid/log/logger.hpp>

namespace onionid::hs
{

constexpr std::chrono::milliseconds kReauthDelay{std::chrono::seconds(10)};

struct ReauthSettings
{
    std::string password;
    std::chrono::milliseconds delay{kReauthDelay};
};

/// @brief Waits settings.delay, then authenticates @p channel again.
///
/// Failure is reported to @p logger and does not throw.
///
/// @return true if the channel accepted the password.
///
bool Reauthenticate(ControlChannel& channel, const ReauthSettings& settings, log::Logger& logger);

} // namespace onionid::hs
