#include <onionid/hs/error.hpp>

namespace onionid::hs
{

const char* ErrorCategory::name() const noexcept
{
    return "onion service";
}

std::string ErrorCategory::message(int value) const
{
    switch (static_cast<Error>(value))
    {
    case Error::KeyFormat:
        return "unsupported key type or size";
    case Error::Decryption:
        return "could not import private key";
    case Error::InvalidEncoding:
        return "invalid encoding";
    }
    return "unknown error";
}

ErrorCategory& ErrorCategory::getInstance()
{
    static ErrorCategory instance;
    return instance;
}

std::error_code MakeErrorCode(Error e)
{
    return std::error_code(static_cast<int>(e), ErrorCategory::getInstance());
}

} // namespace onionid::hs
