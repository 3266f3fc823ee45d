#include <algorithm>
#include <onionid/hs/pkcs1_padding.hpp>
#include <onionid/hs/error.hpp>

namespace onionid::hs
{

PaddedMessage AddPkcs1Padding(std::span<const uint8_t> message)
{
    ThrowIfTrue(message.size() > kMaxPkcs1MessageSize, Error::InvalidEncoding, "message too long for padding");

    PaddedMessage padded{};
    padded[0] = 0x00;
    padded[1] = 0x01;

    // 0xFF filler ends right before the zero separator preceding the message.
    const auto separator = padded.size() - message.size() - 1;
    std::fill(padded.begin() + 2, padded.begin() + separator, 0xFF);
    padded[separator] = 0x00;
    std::copy(message.begin(), message.end(), padded.begin() + separator + 1);

    return padded;
}

} // namespace onionid::hs
