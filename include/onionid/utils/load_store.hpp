#pragma once
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace onionid::utils
{

/// @brief Stores @p value in big-endian order to @p data.
///
/// @param[in] value unsigned value.
/// @param[out] data output buffer of at least sizeof(T) bytes.
///
template <typename T>
inline void store_be(T value, uint8_t* data)
{
    static_assert(std::is_unsigned<T>::value, "Only unsigned types are supported");
    for (size_t i = 0; i < sizeof(T); ++i)
    {
        data[i] = static_cast<uint8_t>(value >> ((sizeof(T) - 1 - i) << 3));
    }
}

} // namespace onionid::utils
