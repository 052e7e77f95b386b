#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "chunkwise/crypto.hpp"

namespace chunkwise::test
{

    /// Scratch directory under the system temp path, removed with everything in it on destruction.
    class TempDir
    {
    public:
        explicit TempDir(const std::string &name)
            : path_(std::filesystem::temp_directory_path() /
                    ("chunkwise_" + name + "_" + chunkwise::crypto::random_hex(6)))
        {
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }

    private:
        std::filesystem::path path_;
    };

    inline std::vector<std::byte> make_payload(std::size_t size, std::uint8_t seed)
    {
        std::vector<std::byte> data(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<std::byte>((i * 31 + seed * 7 + i / 251) % 256);
        }
        return data;
    }

    inline std::vector<std::byte> slice(const std::vector<std::byte> &data, std::uint64_t offset,
                                        std::uint64_t length)
    {
        const auto begin = data.begin() + static_cast<std::ptrdiff_t>(offset);
        return {begin, begin + static_cast<std::ptrdiff_t>(length)};
    }

    inline std::vector<std::byte> read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::vector<std::byte> data(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i)
        {
            data[i] = static_cast<std::byte>(raw[i]);
        }
        return data;
    }

} // namespace chunkwise::test
