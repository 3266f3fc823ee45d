#include <algorithm>
#include <cstring>

#include <openssl/crypto.h>
#include <openssl/ui.h>

#include <onionid/hs/key_loader.hpp>
#include <onionid/hs/error.hpp>

#include <onionid/crypto/asymm_key.hpp>
#include <onionid/crypto/bio.hpp>
#include <onionid/crypto/ed25519_asymm_key.hpp>
#include <onionid/crypto/error_code.hpp>
#include <onionid/crypto/rsa_asymm_key.hpp>

#include <onionid/log/log_manager.hpp>
#include <onionid/utils/string.hpp>

namespace onionid::hs
{

namespace
{

constexpr size_t kMaxPassphraseSize{1024};

bool IsEncryptedPem(std::string_view pem)
{
    return utils::contains(pem, kEncryptedPemMarker) || utils::contains(pem, kEncryptedPkcs8Marker);
}

bool IsSupportedRsaSize(int bits)
{
    return bits == 1023 || bits == 1024;
}

// Hands the passphrase obtained for the current attempt to the PEM reader.
// Without one the read is aborted instead of falling back to a terminal prompt.
int PassphraseCallback(char* buf, int size, int /* rwflag */, void* userData)
{
    auto passphrase = static_cast<const std::optional<std::string>*>(userData);
    if (!passphrase || !passphrase->has_value())
    {
        return -1;
    }

    const auto& value = passphrase->value();
    const auto length = std::min(value.size(), static_cast<size_t>(size));
    std::memcpy(buf, value.data(), length);
    return static_cast<int>(length);
}

crypto::KeyPtr DecodePrivateKey(std::span<const uint8_t> pem, const std::optional<std::string>& passphrase)
{
    auto bio = crypto::BioTraits::createMemoryReader(pem.data(), pem.size());
    auto key = crypto::AsymmKey::fromBio(KeyType::Private, bio, Encoding::PEM, PassphraseCallback,
                                         const_cast<std::optional<std::string>*>(&passphrase));
    if (!key)
    {
        log::debug("PEM decoding failed: {}", crypto::GetLastError().message());
        crypto::ClearErrors();
    }
    return key;
}

} // namespace

PassphraseSource TerminalPassphraseSource()
{
    return [](std::string_view prompt) -> std::optional<std::string> {
        std::string promptText(prompt);
        char buffer[kMaxPassphraseSize];

        if (EVP_read_pw_string(buffer, sizeof(buffer), promptText.c_str(), 0) != 0)
        {
            OPENSSL_cleanse(buffer, sizeof(buffer));
            return std::nullopt;
        }

        std::string passphrase(buffer);
        OPENSSL_cleanse(buffer, sizeof(buffer));
        return passphrase;
    };
}

KeyLoader::KeyLoader(PassphraseSource source, size_t retries)
    : source_(std::move(source))
    , retries_(retries)
{
}

KeyMaterial KeyLoader::loadFromFile(const std::filesystem::path& path)
{
    std::error_code ec;
    auto key = loadFromFile(path, ec);
    if (!key)
    {
        throw HsException(ec, path.string());
    }
    return std::move(key.value());
}

std::optional<KeyMaterial> KeyLoader::loadFromFile(const std::filesystem::path& path, std::error_code& ec)
{
    std::vector<uint8_t> content;
    try
    {
        auto bio = crypto::BioTraits::openFile(path, "rb");
        content = crypto::BioTraits::readAllData(bio);
    }
    catch (const std::system_error& e)
    {
        log::error("Unable to read key file '{}': {}", path.string(), e.what());
        ec = e.code();
        return std::nullopt;
    }

    auto key = loadFromMemory(content, path.string(), ec);
    OPENSSL_cleanse(content.data(), content.size());
    return key;
}

std::optional<KeyMaterial> KeyLoader::loadFromMemory(std::span<const uint8_t> content, std::string_view name,
                                                     std::error_code& ec)
{
    ec.clear();

    std::string_view text(reinterpret_cast<const char*>(content.data()), content.size());
    if (utils::startsWith(text, kEd25519SecretTag))
    {
        log::debug("Key '{}' is a raw Ed25519 secret", name);
        return loadEd25519(content, ec);
    }

    return loadRsa(content, name, ec);
}

std::optional<KeyMaterial> KeyLoader::loadEd25519(std::span<const uint8_t> content, std::error_code& ec)
{
    const auto secretSize = crypto::Ed25519AsymmKey::kKeySize;
    if (content.size() < kEd25519SecretTagSize + secretSize)
    {
        ec = Error::KeyFormat;
        return std::nullopt;
    }

    try
    {
        auto key = crypto::Ed25519AsymmKey::fromPrivateBytes(content.subspan(kEd25519SecretTagSize, secretSize));
        return Ed25519KeyMaterial(std::move(key));
    }
    catch (const std::system_error& e)
    {
        log::error("Unable to import Ed25519 secret: {}", e.what());
        ec = Error::KeyFormat;
        return std::nullopt;
    }
}

std::optional<KeyMaterial> KeyLoader::loadRsa(std::span<const uint8_t> content, std::string_view name,
                                              std::error_code& ec)
{
    std::string_view pem(reinterpret_cast<const char*>(content.data()), content.size());
    const bool encrypted = IsEncryptedPem(pem);
    const auto prompt = utils::format("Enter the password for the private key ({}): ", name);

    for (size_t attempt = 1; attempt <= retries_; ++attempt)
    {
        std::optional<std::string> passphrase;
        if (encrypted)
        {
            passphrase = source_(prompt);
        }

        auto key = DecodePrivateKey(content, passphrase);
        if (passphrase.has_value())
        {
            OPENSSL_cleanse(passphrase->data(), passphrase->size());
        }

        if (!key)
        {
            log::warning("Unable to import private key '{}' (attempt {} of {})", name, attempt, retries_);
            continue;
        }

        if (!crypto::AsymmKey::isAlgorithm(key, "RSA") || !crypto::RsaAsymmKey::hasPrivate(key) ||
            !IsSupportedRsaSize(crypto::AsymmKey::getBits(key)))
        {
            log::error("Key '{}' is not a 1024 bit RSA private key", name);
            ec = Error::KeyFormat;
            return std::nullopt;
        }

        return RsaKeyMaterial(std::move(key));
    }

    ec = Error::Decryption;
    return std::nullopt;
}

} // namespace onionid::hs
