#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <string>

#include "chunkwise/protocol.hpp"
#include "chunkwise/server/config.hpp"
#include "chunkwise/server/session_tracker.hpp"

namespace chunkwise::server
{

    class ArtifactSink;
    class AssemblyEngine;
    class ChunkStore;

    /**
     * Request-facing side of the upload protocol.
     *
     * Validates requests, stores chunk bytes, records progress in the tracker and
     * runs assembly synchronously on the request that completes a session. Every
     * failure is reported as an UploadError carrying the protocol error code.
     * Safe to call from many threads at once.
     */
    class UploadCoordinator
    {
    public:
        /// Throws std::invalid_argument when `limits` admit chunks that cannot be framed.
        UploadCoordinator(ChunkStore &store, SessionTracker &tracker, AssemblyEngine &engine, ArtifactSink &sink,
                          UploadLimits limits, std::chrono::seconds session_timeout);

        protocol::SessionDescriptor begin_or_resume_session(const protocol::BeginSessionRequest &request);

        /// `declared` carries the session metadata sent with the chunk; it creates the session on first contact.
        protocol::ChunkAck receive_chunk(const std::string &session_id, std::uint64_t index,
                                         std::span<const std::byte> bytes,
                                         const std::optional<SessionParameters> &declared = std::nullopt,
                                         const std::optional<std::string> &chunk_hash = std::nullopt);

        std::set<std::uint64_t> query_missing_chunks(const std::string &session_id) const;

        void abort_session(const std::string &session_id);

        /// Retries assembly of a complete session whose previous assembly failed.
        protocol::ChunkAck finalize_session(const std::string &session_id);

        protocol::SessionStatusResponse session_status(const std::string &session_id) const;

        /// Removes idle sessions and orphaned chunk storage. Returns the number of sessions reaped.
        std::size_t reap_expired(Clock::time_point now = Clock::now());

    private:
        SessionParameters validated_parameters(const std::string &file_name, std::uint64_t total_size,
                                               std::uint64_t chunk_size,
                                               const std::optional<std::string> &checksum) const;

        protocol::ChunkAck run_assembly(const SessionSnapshot &session, std::uint64_t index);

        void delete_chunks(const std::string &session_id) noexcept;

        ChunkStore &store_;
        SessionTracker &tracker_;
        AssemblyEngine &engine_;
        ArtifactSink &sink_;
        UploadLimits limits_;
        std::chrono::seconds session_timeout_;
    };

} // namespace chunkwise::server
