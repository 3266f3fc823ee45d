#include <onionid/utils/base32.hpp>

namespace onionid::utils
{

namespace
{

constexpr size_t kBitsPerSymbol{5};
constexpr size_t kSymbolsPerBlock{8};
constexpr char kPadding{'='};

int symbol2value(const char ch)
{
    if (ch >= 'a' && ch <= 'z')
    {
        return ch - 'a';
    }
    if (ch >= 'A' && ch <= 'Z')
    {
        return ch - 'A';
    }
    if (ch >= '2' && ch <= '7')
    {
        return ch - '2' + 26;
    }
    return -1;
}

// Number of trailing symbols in the last block that RFC 4648 can produce.
bool isValidTail(size_t symbols)
{
    switch (symbols % kSymbolsPerBlock)
    {
    case 0:
    case 2:
    case 4:
    case 5:
    case 7:
        return true;
    default:
        return false;
    }
}

} // namespace

std::string base32Encode(std::span<const uint8_t> in)
{
    static const char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz234567";

    std::string out;
    out.reserve((in.size() + 4) / 5 * kSymbolsPerBlock);

    uint32_t buffer{0};
    size_t bits{0};

    for (const auto byte : in)
    {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= kBitsPerSymbol)
        {
            bits -= kBitsPerSymbol;
            out.push_back(kAlphabet[(buffer >> bits) & 0x1F]);
        }
    }

    if (bits > 0)
    {
        out.push_back(kAlphabet[(buffer << (kBitsPerSymbol - bits)) & 0x1F]);
    }

    while (out.size() % kSymbolsPerBlock != 0)
    {
        out.push_back(kPadding);
    }

    return out;
}

std::optional<std::vector<uint8_t>> base32Decode(std::string_view in)
{
    auto symbols = in;
    while (!symbols.empty() && symbols.back() == kPadding)
    {
        symbols.remove_suffix(1);
    }

    if (symbols.size() != in.size() && in.size() % kSymbolsPerBlock != 0)
    {
        return std::nullopt;
    }

    if (!isValidTail(symbols.size()))
    {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(symbols.size() * kBitsPerSymbol / 8);

    uint32_t buffer{0};
    size_t bits{0};

    for (const auto ch : symbols)
    {
        auto value = symbol2value(ch);
        if (value < 0)
        {
            return std::nullopt;
        }

        buffer = (buffer << kBitsPerSymbol) | static_cast<uint32_t>(value);
        bits += kBitsPerSymbol;
        if (bits >= 8)
        {
            bits -= 8;
            out.push_back(static_cast<uint8_t>(buffer >> bits));
        }
    }

    return out;
}

} // namespace onionid::utils
