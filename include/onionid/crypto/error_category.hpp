#pragma once
#include <string>
#include <system_error>

namespace onionid::crypto
{

/// @brief Category of packed OpenSSL error codes, ERR_get_error() values.
class ErrorCategory final : public std::error_category
{
public:
    const char* name() const noexcept override;

    /// @brief Reason string followed by the library name, if OpenSSL knows them.
    std::string message(int value) const override;

    static ErrorCategory& getInstance();

private:
    ErrorCategory() = default;
    ~ErrorCategory() = default;
};

} // namespace onionid::crypto
