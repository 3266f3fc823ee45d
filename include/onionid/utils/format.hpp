#pragma once
#include <sstream>
#include <string>
#include <string_view>

namespace onionid::utils
{

namespace detail
{

constexpr std::string_view kPlaceholder{"{}"};

template <typename T>
void appendNext(std::ostringstream& oss, std::string_view& pattern, const T& value)
{
    auto pos = pattern.find(kPlaceholder);
    if (pos == std::string_view::npos)
    {
        return;
    }

    oss << pattern.substr(0, pos) << value;
    pattern.remove_prefix(pos + kPlaceholder.size());
}

} // namespace detail

/// @brief Substitutes each `{}` of @p pattern with the next argument.
///
/// Arguments without a placeholder are dropped, placeholders without an
/// argument are kept as is.
///
template <typename... Args>
std::string format(std::string_view pattern, const Args&... args)
{
    std::ostringstream oss;
    (detail::appendNext(oss, pattern, args), ...);
    oss << pattern;
    return oss.str();
}

} // namespace onionid::utils
