#pragma once
#include <string_view>
#include <system_error>

#include <onionid/crypto/error_code.hpp>

namespace onionid::crypto
{

/// @brief OpenSSL failure with the code taken from the error queue.
class CryptoException final : public std::system_error
{
public:
    explicit CryptoException(std::error_code ec)
        : std::system_error(ec)
    {
    }

    CryptoException(std::error_code ec, std::string_view what)
        : std::system_error(ec, std::string(what))
    {
    }
};

inline void ThrowIfTrue(bool expression)
{
    if (expression)
    {
        throw CryptoException(GetLastError());
    }
}

inline void ThrowIfTrue(bool expression, std::string_view message)
{
    if (expression)
    {
        throw CryptoException(GetLastError(), message);
    }
}

inline void ThrowIfFalse(bool expression)
{
    ThrowIfTrue(!expression);
}

inline void ThrowIfFalse(bool expression, std::string_view message)
{
    ThrowIfTrue(!expression, message);
}

} // namespace onionid::crypto
