#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace onionid::utils
{

/// @brief Invalid argument or state outside of any error category.
class RuntimeError final : public std::runtime_error
{
public:
    explicit RuntimeError(std::string_view what)
        : std::runtime_error(std::string(what))
    {
    }
};

inline void ThrowIfTrue(bool exprResult, std::string_view msg)
{
    if (exprResult)
    {
        throw RuntimeError(msg);
    }
}

inline void ThrowIfFalse(bool exprResult, std::string_view msg)
{
    ThrowIfTrue(!exprResult, msg);
}

} // namespace onionid::utils
