#include <onionid/crypto/message_digest.hpp>
#include <onionid/crypto/crypto_manager.hpp>
#include <onionid/crypto/hash_traits.hpp>

namespace onionid::crypto
{

MessageDigest::MessageDigest(std::string_view algorithm)
    : algorithm_(CryptoManager::getInstance().fetchDigest(algorithm))
    , ctx_(HashTraits::createContext())
{
    HashTraits::initHash(ctx_, algorithm_);
}

size_t MessageDigest::size() const noexcept
{
    return HashTraits::getSize(algorithm_);
}

MessageDigest& MessageDigest::update(std::span<const uint8_t> data)
{
    HashTraits::updateHash(ctx_, data);
    return *this;
}

MessageDigest& MessageDigest::update(std::string_view data)
{
    return update({reinterpret_cast<const uint8_t*>(data.data()), data.size()});
}

std::span<uint8_t> MessageDigest::final(std::span<uint8_t> out)
{
    return HashTraits::finalHash(ctx_, out);
}

std::vector<uint8_t> MessageDigest::final()
{
    std::vector<uint8_t> out(size());
    auto digest = HashTraits::finalHash(ctx_, out);
    out.resize(digest.size());
    return out;
}

} // namespace onionid::crypto
