#include <openssl/err.h>
#include <onionid/crypto/error_code.hpp>
#include <onionid/crypto/error_category.hpp>

namespace onionid::crypto
{

std::error_code TranslateError(unsigned long error)
{
    if (ERR_SYSTEM_ERROR(error))
    {
        return std::error_code{static_cast<int>(ERR_GET_REASON(error)), std::system_category()};
    }

    return std::error_code{static_cast<int>(error), ErrorCategory::getInstance()};
}

std::error_code GetLastError()
{
    const auto err = ::ERR_get_error();
    if (err)
        return TranslateError(err);
    return TranslateError(ERR_R_OPERATION_FAIL);
}

void ClearErrors() noexcept
{
    ::ERR_clear_error();
}

} // namespace onionid::crypto
