#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>
#include <openssl/bio.h>

#include <onionid/crypto/pointers.hpp>
#include <onionid/crypto/exception.hpp>

namespace onionid::crypto
{

class BioTraits
{
    static constexpr size_t kBufferSize{4096};

public:
    static inline BioPtr openFile(const std::filesystem::path& path, const char* mode)
    {
        BioPtr result{BIO_new_file(path.c_str(), mode)};
        ThrowIfTrue(result == nullptr);
        return result;
    }

    static inline BioPtr createMemoryBuffer()
    {
        BioPtr result{BIO_new(BIO_s_mem())};
        ThrowIfTrue(result == nullptr);
        return result;
    }

    static inline BioPtr createMemoryReader(const uint8_t* data, size_t size)
    {
        constexpr size_t limit = std::numeric_limits<int>::max();
        BioPtr bio{BIO_new_mem_buf(data, static_cast<int>(size > limit ? limit : size))};
        ThrowIfTrue(bio == nullptr);
        return bio;
    }

    static inline size_t readData(Bio* bio, uint8_t* data, size_t length)
    {
        size_t readBytesLen{0};
        if (0 < BIO_read_ex(bio, data, length, &readBytesLen))
        {
            return readBytesLen;
        }
        ThrowIfFalse(BIO_eof(bio));
        return 0;
    }

    static inline std::vector<uint8_t> readAllData(Bio* bio)
    {
        std::vector<uint8_t> data;
        std::array<uint8_t, kBufferSize> buffer{};
        size_t bytesRead;

        while ((bytesRead = readData(bio, buffer.data(), buffer.size())) > 0)
        {
            data.insert(data.end(), buffer.data(), buffer.data() + bytesRead);
        }

        return data;
    }

    static inline std::string getMemoryDataAsString(Bio* bio)
    {
        char* data{nullptr};
        auto length = BIO_get_mem_data(bio, &data);
        ThrowIfTrue(data == nullptr, "invalid pointer");
        return std::string(data, length);
    }
};

} // namespace onionid::crypto
