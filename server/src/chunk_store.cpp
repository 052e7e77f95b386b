#include "chunkwise/server/chunk_store.hpp"

#include <fstream>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkwise/server/upload_error.hpp"

namespace chunkwise::server
{

    namespace
    {
        constexpr auto kChunkExtension = ".chunk";

        class FilesystemChunkSequence final : public ChunkSequence
        {
        public:
            FilesystemChunkSequence(const FilesystemChunkStore &store, std::string session_id,
                                    std::uint64_t total_chunks)
                : store_(store), session_id_(std::move(session_id)), total_chunks_(total_chunks)
            {
            }

            std::optional<std::vector<std::byte>> next() override
            {
                if (next_index_ >= total_chunks_)
                {
                    return std::nullopt;
                }
                const auto path = store_.chunk_path(session_id_, next_index_);
                std::ifstream in(path, std::ios::binary);
                if (!in.is_open())
                {
                    throw UploadError(chunkwise::ErrorCode::StorageError,
                                      "Chunk " + std::to_string(next_index_) + " is missing from storage");
                }
                std::error_code ec;
                const auto size = std::filesystem::file_size(path, ec);
                if (ec)
                {
                    throw UploadError(chunkwise::ErrorCode::StorageError, "Failed to stat chunk: " + ec.message());
                }
                std::vector<std::byte> buffer(static_cast<std::size_t>(size));
                in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                if (static_cast<std::uintmax_t>(in.gcount()) != size)
                {
                    throw UploadError(chunkwise::ErrorCode::StorageError,
                                      "Short read on chunk " + std::to_string(next_index_));
                }
                ++next_index_;
                return buffer;
            }

            void reset() override
            {
                next_index_ = 0;
            }

        private:
            const FilesystemChunkStore &store_;
            std::string session_id_;
            std::uint64_t total_chunks_;
            std::uint64_t next_index_{0};
        };

    } // namespace

    FilesystemChunkStore::FilesystemChunkStore(std::filesystem::path root, RemovalRetry removal)
        : root_(std::move(root)), removal_(removal)
    {
        std::filesystem::create_directories(root_);
    }

    void FilesystemChunkStore::write_chunk(const std::string &session_id, std::uint64_t index,
                                           std::span<const std::byte> bytes)
    {
        const auto dir = session_dir(session_id);
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            throw UploadError(chunkwise::ErrorCode::StorageError, "Failed to create chunk directory: " + ec.message());
        }

        const auto final_path = chunk_path(session_id, index);
        auto temp_path = final_path;
        temp_path += "." + std::to_string(temp_counter_.fetch_add(1)) + ".tmp";
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw UploadError(chunkwise::ErrorCode::StorageError, "Failed to open " + temp_path.string());
            }
            out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out)
            {
                out.close();
                std::filesystem::remove(temp_path, ec);
                throw UploadError(chunkwise::ErrorCode::StorageError, "Failed to write chunk " + std::to_string(index));
            }
        }

        std::filesystem::rename(temp_path, final_path, ec);
        if (ec)
        {
            std::error_code cleanup;
            std::filesystem::remove(temp_path, cleanup);
            throw UploadError(chunkwise::ErrorCode::StorageError, "Failed to publish chunk: " + ec.message());
        }
    }

    std::unique_ptr<ChunkSequence> FilesystemChunkStore::read_chunks_in_order(const std::string &session_id,
                                                                              std::uint64_t total_chunks) const
    {
        return std::make_unique<FilesystemChunkSequence>(*this, session_id, total_chunks);
    }

    bool FilesystemChunkStore::has_chunk(const std::string &session_id, std::uint64_t index) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(chunk_path(session_id, index), ec);
    }

    void FilesystemChunkStore::delete_session(const std::string &session_id)
    {
        const auto dir = session_dir(session_id);
        std::error_code ec;
        for (std::size_t attempt = 1;; ++attempt)
        {
            std::filesystem::remove_all(dir, ec);
            if (!ec)
            {
                return;
            }
            if (attempt >= removal_.attempts)
            {
                break;
            }
            spdlog::warn("Removing chunks of {} failed ({}), attempt {}", session_id, ec.message(), attempt);
            std::this_thread::sleep_for(removal_.wait);
        }
        throw UploadError(chunkwise::ErrorCode::StorageError,
                          "Failed to remove chunks of " + session_id + ": " + ec.message());
    }

    std::vector<std::string> FilesystemChunkStore::sessions() const
    {
        std::vector<std::string> result;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(root_, ec))
        {
            if (entry.is_directory())
            {
                result.push_back(entry.path().filename().string());
            }
        }
        if (ec)
        {
            throw UploadError(chunkwise::ErrorCode::StorageError, "Failed to list chunk storage: " + ec.message());
        }
        return result;
    }

    std::filesystem::path FilesystemChunkStore::chunk_path(const std::string &session_id, std::uint64_t index) const
    {
        return session_dir(session_id) / (std::to_string(index) + kChunkExtension);
    }

    std::filesystem::path FilesystemChunkStore::session_dir(const std::string &session_id) const
    {
        return root_ / session_id;
    }

} // namespace chunkwise::server
