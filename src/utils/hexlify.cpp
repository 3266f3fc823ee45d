#include <onionid/utils/hexlify.hpp>
#include <onionid/utils/exception.hpp>

namespace onionid::utils
{

inline uint8_t char2digit(const char ch)
{
    if (ch >= '0' && ch <= '9')
    {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f')
    {
        return ch - 'a' + 0x0A;
    }
    if (ch >= 'A' && ch <= 'F')
    {
        return ch - 'A' + 0x0A;
    }
    throw RuntimeError("invalid hexadecimal symbol");
}

std::string hexlify(std::span<const uint8_t> in)
{
    static const uint8_t kHexMap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                        '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string out;
    out.resize(in.size() * 2);

    for (size_t i = 0, j = 0; i < in.size(); ++i)
    {
        out[j++] = kHexMap[(in[i] >> 4)];
        out[j++] = kHexMap[in[i] & 0xF];
    }

    return out;
}

std::vector<uint8_t> unhexlify(std::string_view in)
{
    ThrowIfFalse(in.size() % 2 == 0, "even string length required");

    std::vector<uint8_t> out;
    out.resize(in.size() / 2);

    for (size_t i = 0, j = 0; i < in.size(); i += 2)
    {
        out[j++] = char2digit(in[i]) << 4 | char2digit(in[i + 1]);
    }

    return out;
}

} // namespace onionid::utils
