#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunkwise::server
{

    /// Lazy, finite sequence of a session's chunk buffers in index order.
    class ChunkSequence
    {
    public:
        virtual ~ChunkSequence() = default;

        /// Next chunk, or std::nullopt once every index has been produced.
        virtual std::optional<std::vector<std::byte>> next() = 0;

        /// Restart from index 0.
        virtual void reset() = 0;
    };

    class ChunkStore
    {
    public:
        virtual ~ChunkStore() = default;

        /// Once this returns, the chunk is fully readable; a failed write leaves no visible chunk.
        virtual void write_chunk(const std::string &session_id, std::uint64_t index,
                                 std::span<const std::byte> bytes) = 0;

        virtual std::unique_ptr<ChunkSequence> read_chunks_in_order(const std::string &session_id,
                                                                    std::uint64_t total_chunks) const = 0;

        virtual bool has_chunk(const std::string &session_id, std::uint64_t index) const = 0;

        /// No-op for sessions without stored chunks.
        virtual void delete_session(const std::string &session_id) = 0;

        /// Session ids that currently own chunk storage.
        virtual std::vector<std::string> sessions() const = 0;
    };

    struct RemovalRetry
    {
        std::size_t attempts{5};
        std::chrono::milliseconds wait{std::chrono::milliseconds{100}};
    };

    /// Stores chunks as `<root>/<session_id>/<index>.chunk`.
    class FilesystemChunkStore final : public ChunkStore
    {
    public:
        explicit FilesystemChunkStore(std::filesystem::path root, RemovalRetry removal = {});

        void write_chunk(const std::string &session_id, std::uint64_t index,
                         std::span<const std::byte> bytes) override;

        std::unique_ptr<ChunkSequence> read_chunks_in_order(const std::string &session_id,
                                                            std::uint64_t total_chunks) const override;

        bool has_chunk(const std::string &session_id, std::uint64_t index) const override;

        void delete_session(const std::string &session_id) override;

        std::vector<std::string> sessions() const override;

        std::filesystem::path chunk_path(const std::string &session_id, std::uint64_t index) const;

    private:
        std::filesystem::path session_dir(const std::string &session_id) const;

        std::filesystem::path root_;
        RemovalRetry removal_;
        std::atomic<std::uint64_t> temp_counter_{0};
    };

} // namespace chunkwise::server
