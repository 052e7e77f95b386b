#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace chunkwise::client
{

    /// Random-access bytes of the file being uploaded. `read` may be called from several threads.
    class ChunkSource
    {
    public:
        virtual ~ChunkSource() = default;

        virtual std::string file_name() const = 0;

        virtual std::uint64_t size() const = 0;

        /// Throws std::runtime_error when fewer than `length` bytes are available.
        virtual std::vector<std::byte> read(std::uint64_t offset, std::size_t length) const = 0;
    };

    class FileChunkSource final : public ChunkSource
    {
    public:
        explicit FileChunkSource(std::filesystem::path path);

        std::string file_name() const override;
        std::uint64_t size() const override { return size_; }
        std::vector<std::byte> read(std::uint64_t offset, std::size_t length) const override;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
        std::uint64_t size_{};
        mutable std::mutex mutex_;
        mutable std::ifstream stream_;
    };

    class MemoryChunkSource final : public ChunkSource
    {
    public:
        MemoryChunkSource(std::string file_name, std::vector<std::byte> data);

        std::string file_name() const override { return file_name_; }
        std::uint64_t size() const override { return data_.size(); }
        std::vector<std::byte> read(std::uint64_t offset, std::size_t length) const override;

    private:
        std::string file_name_;
        std::vector<std::byte> data_;
    };

} // namespace chunkwise::client
