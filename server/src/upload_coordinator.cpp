#include "chunkwise/server/upload_coordinator.hpp"

#include <spdlog/spdlog.h>

#include "chunkwise/crypto.hpp"
#include "chunkwise/server/artifact_sink.hpp"
#include "chunkwise/server/assembly_engine.hpp"
#include "chunkwise/server/chunk_store.hpp"
#include "chunkwise/server/upload_error.hpp"
#include "upload_validation.hpp"

namespace chunkwise::server
{

    namespace
    {

        // Id length in random bytes; rendered as twice as many hex characters.
        constexpr std::size_t kGeneratedIdBytes = 16;

        protocol::ChunkAck make_ack(const std::string &session_id, std::uint64_t index, bool complete, bool assembled,
                                    std::uint64_t received, std::uint64_t total)
        {
            return protocol::ChunkAck{
                .session_id = session_id,
                .index = index,
                .complete = complete,
                .assembled = assembled,
                .received_chunks = received,
                .total_chunks = total,
            };
        }

        protocol::ChunkAck assembled_ack(const std::string &session_id, std::uint64_t index, std::uint64_t total)
        {
            return make_ack(session_id, index, true, true, total, total);
        }

        // Late chunks for an assembled session are acknowledged only when they belong to the assembled file.
        protocol::ChunkAck tombstone_ack(const std::string &session_id, std::uint64_t index, const Tombstone &tombstone,
                                         const std::optional<SessionParameters> &declared)
        {
            if (declared && !tombstone.parameters.same_shape(*declared))
            {
                throw UploadError(chunkwise::ErrorCode::SessionConflict,
                                  "Session " + session_id + " was already assembled from a different file");
            }
            if (index >= tombstone.total_chunks)
            {
                throw UploadError(chunkwise::ErrorCode::InvalidChunk,
                                  "Chunk index " + std::to_string(index) + " out of range (" +
                                      std::to_string(tombstone.total_chunks) + " chunks)");
            }
            return assembled_ack(session_id, index, tombstone.total_chunks);
        }

        [[noreturn]] void throw_unknown(const std::string &session_id)
        {
            throw UploadError(chunkwise::ErrorCode::UnknownSession, "Unknown session " + session_id);
        }

    } // namespace

    UploadCoordinator::UploadCoordinator(ChunkStore &store, SessionTracker &tracker, AssemblyEngine &engine,
                                         ArtifactSink &sink, UploadLimits limits,
                                         std::chrono::seconds session_timeout)
        : store_(store), tracker_(tracker), engine_(engine), sink_(sink), limits_(std::move(limits)),
          session_timeout_(session_timeout)
    {
        upload_validation::check_limits(limits_);
    }

    protocol::SessionDescriptor UploadCoordinator::begin_or_resume_session(
        const protocol::BeginSessionRequest &request)
    {
        const auto parameters =
            validated_parameters(request.file_name, request.total_size, request.chunk_size, request.checksum);

        std::string session_id;
        if (request.session_id)
        {
            upload_validation::validate_session_id(*request.session_id);
            session_id = *request.session_id;
        }
        else
        {
            session_id = crypto::random_hex(kGeneratedIdBytes);
        }

        const auto result = tracker_.create_or_resume(session_id, parameters);
        const auto &session = result.snapshot;
        protocol::SessionDescriptor descriptor{
            .session_id = session_id,
            .file_name = session.parameters.file_name,
            .total_size = session.parameters.total_size,
            .chunk_size = session.parameters.chunk_size,
            .total_chunks = session.total_chunks,
            .received = {session.received.begin(), session.received.end()},
            .resumed = result.resumed,
            .assembled = false,
        };
        spdlog::info("{} session {} for {} ({} bytes, {} chunks, {} received)",
                     result.resumed ? "Resumed" : "Started", session_id, session.parameters.file_name,
                     session.parameters.total_size, session.total_chunks, session.received.size());

        if (session.total_chunks == 0)
        {
            if (auto claimed = tracker_.claim_assembly(session_id))
            {
                descriptor.assembled = run_assembly(*claimed, 0).assembled;
            }
        }
        return descriptor;
    }

    protocol::ChunkAck UploadCoordinator::receive_chunk(const std::string &session_id, std::uint64_t index,
                                                        std::span<const std::byte> bytes,
                                                        const std::optional<SessionParameters> &declared,
                                                        const std::optional<std::string> &chunk_hash)
    {
        upload_validation::validate_session_id(session_id);

        std::optional<SessionParameters> parameters;
        if (declared)
        {
            parameters = validated_parameters(declared->file_name, declared->total_size, declared->chunk_size,
                                              declared->checksum);
        }

        auto session = tracker_.try_snapshot(session_id);
        if (!session)
        {
            if (auto tombstone = tracker_.tombstone(session_id))
            {
                return tombstone_ack(session_id, index, *tombstone, parameters);
            }
            if (!parameters)
            {
                throw_unknown(session_id);
            }
            session = tracker_.create_or_resume(session_id, *parameters).snapshot;
        }
        else if (parameters && !session->parameters.same_shape(*parameters))
        {
            throw UploadError(chunkwise::ErrorCode::SessionConflict,
                              "Chunk metadata does not match session " + session_id);
        }

        if (index >= session->total_chunks)
        {
            throw UploadError(chunkwise::ErrorCode::InvalidChunk,
                              "Chunk index " + std::to_string(index) + " out of range (" +
                                  std::to_string(session->total_chunks) + " chunks)");
        }
        const auto expected = session->parameters.layout().chunk_length(index);
        if (bytes.size() != expected)
        {
            throw UploadError(chunkwise::ErrorCode::InvalidChunk,
                              "Chunk " + std::to_string(index) + " has " + std::to_string(bytes.size()) +
                                  " bytes, expected " + std::to_string(expected));
        }
        if (chunk_hash && crypto::hash_bytes(bytes) != *chunk_hash)
        {
            throw UploadError(chunkwise::ErrorCode::ChecksumMismatch,
                              "Chunk " + std::to_string(index) + " failed hash verification");
        }

        const auto received = session->received.size();
        if (session->phase == SessionPhase::Assembling)
        {
            return make_ack(session_id, index, session->complete(), false, received, session->total_chunks);
        }
        // A failed assembly may have been caused by a corrupt chunk, so re-sent chunks replace stored ones.
        if (session->phase == SessionPhase::Receiving && session->received.contains(index))
        {
            return make_ack(session_id, index, session->complete(), false, received, session->total_chunks);
        }

        store_.write_chunk(session_id, index, bytes);

        MarkResult mark;
        try
        {
            mark = tracker_.mark_received(session_id, index);
        }
        catch (const UploadError &ex)
        {
            if (ex.code() == chunkwise::ErrorCode::UnknownSession)
            {
                if (auto tombstone = tracker_.tombstone(session_id))
                {
                    return tombstone_ack(session_id, index, *tombstone, parameters);
                }
            }
            throw;
        }

        spdlog::debug("Session {} chunk {} stored ({}/{})", session_id, index, mark.received_count,
                      mark.total_chunks);
        if (mark.claimed_assembly && mark.claimed_snapshot)
        {
            return run_assembly(*mark.claimed_snapshot, index);
        }
        return make_ack(session_id, index, mark.complete, false, mark.received_count, mark.total_chunks);
    }

    std::set<std::uint64_t> UploadCoordinator::query_missing_chunks(const std::string &session_id) const
    {
        upload_validation::validate_session_id(session_id);
        return tracker_.missing(session_id);
    }

    void UploadCoordinator::abort_session(const std::string &session_id)
    {
        upload_validation::validate_session_id(session_id);
        const auto removed = tracker_.remove(session_id);
        if (!removed.existed)
        {
            return;
        }
        // The assembling request owns the chunks until it finishes and deletes them itself.
        if (!removed.was_assembling)
        {
            delete_chunks(session_id);
        }
        spdlog::info("Session {} aborted", session_id);
    }

    protocol::ChunkAck UploadCoordinator::finalize_session(const std::string &session_id)
    {
        upload_validation::validate_session_id(session_id);
        auto session = tracker_.try_snapshot(session_id);
        if (!session)
        {
            if (auto tombstone = tracker_.tombstone(session_id))
            {
                return assembled_ack(session_id, 0, tombstone->total_chunks);
            }
            throw_unknown(session_id);
        }
        if (!session->complete())
        {
            throw UploadError(chunkwise::ErrorCode::InvalidChunk,
                              "Session " + session_id + " is missing " +
                                  std::to_string(session->total_chunks - session->received.size()) + " chunks");
        }

        auto claimed = tracker_.claim_assembly(session_id);
        if (!claimed)
        {
            // Another request is assembling right now.
            return make_ack(session_id, 0, true, false, session->received.size(), session->total_chunks);
        }
        return run_assembly(*claimed, 0);
    }

    protocol::SessionStatusResponse UploadCoordinator::session_status(const std::string &session_id) const
    {
        upload_validation::validate_session_id(session_id);
        const auto session = tracker_.snapshot(session_id);
        return protocol::SessionStatusResponse{
            .session_id = session.session_id,
            .file_name = session.parameters.file_name,
            .phase = std::string(to_string(session.phase)),
            .received_chunks = session.received.size(),
            .total_chunks = session.total_chunks,
            .received_bytes = session.received_bytes(),
            .total_size = session.parameters.total_size,
        };
    }

    std::size_t UploadCoordinator::reap_expired(Clock::time_point now)
    {
        const auto expired = tracker_.collect_expired(now, session_timeout_);
        for (const auto &session_id : expired)
        {
            spdlog::info("Session {} expired after {}s of inactivity", session_id, session_timeout_.count());
            delete_chunks(session_id);
        }

        for (const auto &session_id : store_.sessions())
        {
            if (!tracker_.contains(session_id))
            {
                spdlog::debug("Removing orphaned chunks of {}", session_id);
                delete_chunks(session_id);
            }
        }
        return expired.size();
    }

    SessionParameters UploadCoordinator::validated_parameters(const std::string &file_name,
                                                              std::uint64_t total_size, std::uint64_t chunk_size,
                                                              const std::optional<std::string> &checksum) const
    {
        auto name = upload_validation::sanitize_file_name(file_name);
        upload_validation::check_file_limits(limits_, name, total_size);
        return SessionParameters{
            .file_name = std::move(name),
            .total_size = total_size,
            .chunk_size = upload_validation::resolve_chunk_size(limits_, chunk_size),
            .checksum = checksum,
        };
    }

    protocol::ChunkAck UploadCoordinator::run_assembly(const SessionSnapshot &session, std::uint64_t index)
    {
        const auto &session_id = session.session_id;
        AssembledArtifact artifact;
        try
        {
            artifact = engine_.assemble(session);
        }
        catch (const UploadError &)
        {
            if (tracker_.mark_assembly_failed(session) == AssemblyRelease::Orphaned)
            {
                // Aborted while assembling; nobody else will clean up.
                delete_chunks(session_id);
            }
            throw;
        }

        try
        {
            sink_.deliver(artifact);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Artifact sink rejected {}: {}", artifact.final_path.string(), ex.what());
        }

        if (tracker_.mark_assembled(session) == AssemblyRelease::Superseded)
        {
            spdlog::info("Session {} was restarted during assembly; keeping the new session's chunks", session_id);
        }
        else
        {
            delete_chunks(session_id);
        }
        return assembled_ack(session_id, index, session.total_chunks);
    }

    void UploadCoordinator::delete_chunks(const std::string &session_id) noexcept
    {
        try
        {
            store_.delete_session(session_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Chunks of {} left for the reaper: {}", session_id, ex.what());
        }
    }

} // namespace chunkwise::server
