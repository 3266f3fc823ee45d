/// @file
/// @brief Errors of onion service identifier derivation and key loading.

#pragma once
#include <string>
#include <string_view>
#include <system_error>

namespace onionid::hs
{

enum class Error
{
    KeyFormat = 1,   ///< Wrong key type or unsupported key size.
    Decryption,      ///< Private key could not be imported within the retry budget.
    InvalidEncoding, ///< Malformed base32 input or byte buffer of the wrong size.
};

class ErrorCategory final : public std::error_category
{
public:
    const char* name() const noexcept override;

    std::string message(int value) const override;

    static ErrorCategory& getInstance();

private:
    ErrorCategory() = default;
    ~ErrorCategory() = default;
};

std::error_code MakeErrorCode(Error e);

inline std::error_code make_error_code(Error e)
{
    return MakeErrorCode(e);
}

/// @brief Exception thrown by the throwing onion service API.
class HsException final : public std::system_error
{
public:
    explicit HsException(std::error_code ec)
        : std::system_error(ec)
    {
    }

    HsException(std::error_code ec, std::string_view what)
        : std::system_error(ec, std::string(what))
    {
    }
};

inline void ThrowIfTrue(bool expression, Error e, std::string_view message)
{
    if (expression)
    {
        throw HsException(MakeErrorCode(e), message);
    }
}

} // namespace onionid::hs

namespace std
{

template <>
struct is_error_code_enum<onionid::hs::Error> : true_type
{
};

} // namespace std
