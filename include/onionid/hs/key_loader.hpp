#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <onionid/hs/key_material.hpp>

namespace onionid::hs
{

/// Leading tag of a raw Ed25519 secret key file written by tor.
constexpr std::string_view kEd25519SecretTag{"== ed25519v1-secret: type0 =="};

/// Size of the tag field, the tag is padded with zero bytes.
constexpr size_t kEd25519SecretTagSize{32};

/// Header line of a PEM block encrypted with a legacy cipher.
constexpr std::string_view kEncryptedPemMarker{"Proc-Type: 4,ENCRYPTED"};

/// Header line of an encrypted PKCS#8 block.
constexpr std::string_view kEncryptedPkcs8Marker{"BEGIN ENCRYPTED PRIVATE KEY"};

/// Returns the passphrase for a key, or std::nullopt if none could be read.
using PassphraseSource = std::function<std::optional<std::string>(std::string_view prompt)>;

/// @brief Reads passphrases from the controlling terminal with echo disabled.
PassphraseSource TerminalPassphraseSource();

/// @brief Loads the private key of a service from a key file.
///
/// Files starting with kEd25519SecretTag hold a raw Ed25519 secret right after
/// the tag field. Anything else is parsed as a PEM RSA private key; encrypted
/// keys make the loader ask the passphrase source, once per attempt.
///
/// Only RSA private keys of 1023 or 1024 bits are accepted.
///
/// Loading blocks while the passphrase source waits for input, so a loader
/// must not be shared between threads.
///
class KeyLoader final
{
public:
    static constexpr size_t kDefaultRetries{3};

    explicit KeyLoader(PassphraseSource source = TerminalPassphraseSource(), size_t retries = kDefaultRetries);

    ~KeyLoader() = default;

    KeyLoader(const KeyLoader& other) = delete;
    KeyLoader& operator=(const KeyLoader& other) = delete;

    /// @throw HsException with Error::KeyFormat or Error::Decryption.
    KeyMaterial loadFromFile(const std::filesystem::path& path);

    std::optional<KeyMaterial> loadFromFile(const std::filesystem::path& path, std::error_code& ec);

    /// @param[in] content key file content.
    /// @param[in] name key name used in prompts and log messages.
    std::optional<KeyMaterial> loadFromMemory(std::span<const uint8_t> content, std::string_view name,
                                              std::error_code& ec);

    size_t getRetries() const noexcept
    {
        return retries_;
    }

private:
    std::optional<KeyMaterial> loadEd25519(std::span<const uint8_t> content, std::error_code& ec);

    std::optional<KeyMaterial> loadRsa(std::span<const uint8_t> content, std::string_view name,
                                       std::error_code& ec);

private:
    PassphraseSource source_;
    size_t retries_;
};

} // namespace onionid::hs
