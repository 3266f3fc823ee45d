#pragma once
#include <string_view>
#include <system_error>

namespace onionid::hs
{

/// @brief Authenticated control connection to a tor process.
class ControlChannel
{
public:
    ControlChannel() = default;

    virtual ~ControlChannel() = default;

    /// @brief Authenticates with @p password, reporting failures through @p ec.
    virtual void authenticate(std::string_view password, std::error_code& ec) = 0;
};

} // namespace onionid::hs
