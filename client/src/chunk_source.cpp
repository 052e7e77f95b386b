#include "chunkwise/client/chunk_source.hpp"

#include <stdexcept>

namespace chunkwise::client
{

    FileChunkSource::FileChunkSource(std::filesystem::path path)
        : path_(std::move(path)), stream_(path_, std::ios::binary)
    {
        if (!std::filesystem::is_regular_file(path_) || !stream_.is_open())
        {
            throw std::runtime_error("Cannot open " + path_.string());
        }
        size_ = std::filesystem::file_size(path_);
    }

    std::string FileChunkSource::file_name() const
    {
        return path_.filename().string();
    }

    std::vector<std::byte> FileChunkSource::read(std::uint64_t offset, std::size_t length) const
    {
        std::vector<std::byte> buffer(length);
        std::lock_guard lock(mutex_);
        stream_.clear();
        stream_.seekg(static_cast<std::streamoff>(offset));
        stream_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::size_t>(stream_.gcount()) != length)
        {
            throw std::runtime_error("Short read from " + path_.string() + " at offset " + std::to_string(offset));
        }
        return buffer;
    }

    MemoryChunkSource::MemoryChunkSource(std::string file_name, std::vector<std::byte> data)
        : file_name_(std::move(file_name)), data_(std::move(data))
    {
    }

    std::vector<std::byte> MemoryChunkSource::read(std::uint64_t offset, std::size_t length) const
    {
        if (offset > data_.size() || length > data_.size() - offset)
        {
            throw std::runtime_error("Read past the end of " + file_name_);
        }
        const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
        return {begin, begin + static_cast<std::ptrdiff_t>(length)};
    }

} // namespace chunkwise::client
