#pragma once
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
#include <onionid/crypto/pointers.hpp>

namespace onionid::crypto
{

/// @brief Incremental hash over a fetched digest algorithm.
class MessageDigest final
{
public:
    explicit MessageDigest(std::string_view algorithm);

    ~MessageDigest() = default;

    MessageDigest(MessageDigest&& other) noexcept = default;
    MessageDigest& operator=(MessageDigest&& other) noexcept = default;

    size_t size() const noexcept;

    MessageDigest& update(std::span<const uint8_t> data);

    MessageDigest& update(std::string_view data);

    /// @brief Writes the digest to @p out, which must hold at least size() bytes.
    std::span<uint8_t> final(std::span<uint8_t> out);

    std::vector<uint8_t> final();

private:
    HashPtr algorithm_;
    HashCtxPtr ctx_;
};

} // namespace onionid::crypto
