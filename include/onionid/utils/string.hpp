#pragma once
#include <algorithm>
#include <string_view>

namespace onionid::utils
{

inline bool equals(std::string_view a, std::string_view b)
{
    return std::equal(a.begin(), a.end(), b.begin(), b.end());
}

inline bool startsWith(std::string_view str, std::string_view prefix)
{
    return str.substr(0, prefix.size()) == prefix;
}

inline bool contains(std::string_view str, std::string_view what)
{
    return str.find(what) != std::string_view::npos;
}

} // namespace onionid::utils
