#include <algorithm>
#include <onionid/hs/key_digest.hpp>
#include <onionid/crypto/message_digest.hpp>

namespace onionid::hs
{

KeyDigest CalcKeyDigest(const RsaKeyMaterial& key)
{
    KeyDigest digest{};
    crypto::MessageDigest("SHA1").update(key.publicBytes()).final(digest);
    return digest;
}

PermanentId CalcPermanentId(const RsaKeyMaterial& key)
{
    auto digest = CalcKeyDigest(key);

    PermanentId permanentId{};
    std::copy_n(digest.begin(), permanentId.size(), permanentId.begin());
    return permanentId;
}

} // namespace onionid::hs
