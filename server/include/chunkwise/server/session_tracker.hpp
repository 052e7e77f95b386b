#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "chunkwise/chunk_layout.hpp"

namespace chunkwise::server
{

    class ChunkStore;

    using Clock = std::chrono::system_clock;

    struct SessionParameters
    {
        std::string file_name;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::optional<std::string> checksum{};

        ChunkLayout layout() const { return ChunkLayout{total_size, chunk_size}; }

        /// Same file name, size and chunk size; the checksum is not part of a session's identity.
        bool same_shape(const SessionParameters &other) const noexcept;
    };

    enum class SessionPhase : std::uint8_t
    {
        Receiving,
        Assembling,
        AssemblyFailed
    };

    std::string_view to_string(SessionPhase phase) noexcept;

    struct SessionSnapshot
    {
        std::string session_id;
        SessionParameters parameters;
        std::uint64_t total_chunks{};
        std::set<std::uint64_t> received;
        SessionPhase phase{SessionPhase::Receiving};
        Clock::time_point created_at{};
        Clock::time_point last_activity_at{};
        /// Distinguishes a session from an earlier one that used the same id. Not persisted.
        std::uint64_t generation{};

        bool complete() const noexcept { return received.size() == total_chunks; }
        std::set<std::uint64_t> missing() const;
        std::uint64_t received_bytes() const;
    };

    struct CreateResult
    {
        SessionSnapshot snapshot;
        bool resumed{};
    };

    struct MarkResult
    {
        bool complete{};
        bool newly_received{};
        /// The caller won the right to assemble this session and must run assembly.
        bool claimed_assembly{};
        std::uint64_t received_count{};
        std::uint64_t total_chunks{};
        /// State at the moment of the claim; set only when claimed_assembly is true.
        std::optional<SessionSnapshot> claimed_snapshot;
    };

    struct RemoveResult
    {
        bool existed{};
        bool was_assembling{};
    };

    /// Outcome of handing a claimed assembly back to the tracker.
    enum class AssemblyRelease : std::uint8_t
    {
        /// The claimed session was still registered and has been updated.
        Applied,
        /// The session was removed while assembling and nothing replaced it; its chunks are unowned.
        Orphaned,
        /// A newer session with the same id owns the id and the chunk storage now.
        Superseded
    };

    struct Tombstone
    {
        SessionParameters parameters;
        std::uint64_t total_chunks{};
        Clock::time_point assembled_at{};
    };

    /**
     * Registry of in-progress sessions and the chunk indices each has received.
     *
     * Every session has its own mutex; the registry mutex only guards the map and
     * is never held while a session mutex is acquired. When constructed with a
     * state directory, each session is mirrored to `<state_dir>/<session_id>.json`
     * and reloaded on the next start.
     */
    class SessionTracker
    {
    public:
        explicit SessionTracker(std::optional<std::filesystem::path> state_dir = std::nullopt,
                                const ChunkStore *store = nullptr);

        /// Throws UploadError(SessionConflict) when the id exists with a different shape.
        CreateResult create_or_resume(const std::string &session_id, const SessionParameters &parameters,
                                      Clock::time_point now = Clock::now());

        bool contains(const std::string &session_id) const;

        /// Throws UploadError(UnknownSession).
        SessionSnapshot snapshot(const std::string &session_id) const;

        std::optional<SessionSnapshot> try_snapshot(const std::string &session_id) const;

        /// False while the session is being assembled; throws UploadError(UnknownSession).
        bool accepts_writes(const std::string &session_id) const;

        /// Idempotent. Claims assembly when this call completes a session in the Receiving phase.
        MarkResult mark_received(const std::string &session_id, std::uint64_t index,
                                 Clock::time_point now = Clock::now());

        bool is_complete(const std::string &session_id) const;

        std::set<std::uint64_t> missing(const std::string &session_id) const;

        /// Moves a complete, non-assembling session to Assembling. Returns its snapshot on success.
        std::optional<SessionSnapshot> claim_assembly(const std::string &session_id);

        /// Forgets the claimed session and records a tombstone for late duplicate chunks.
        /// `claimed` is the snapshot returned with the claim; a newer session under the same id is left alone.
        AssemblyRelease mark_assembled(const SessionSnapshot &claimed, Clock::time_point now = Clock::now());

        AssemblyRelease mark_assembly_failed(const SessionSnapshot &claimed);

        RemoveResult remove(const std::string &session_id);

        std::optional<Tombstone> tombstone(const std::string &session_id) const;

        /// Removes sessions idle for longer than `timeout` (except ones assembling) and old tombstones.
        std::vector<std::string> collect_expired(Clock::time_point now, std::chrono::seconds timeout);

        std::size_t size() const;

    private:
        struct Entry
        {
            mutable std::mutex mutex;
            SessionSnapshot state;
            bool removed{false};
        };

        std::shared_ptr<Entry> find_entry(const std::string &session_id) const;
        std::shared_ptr<Entry> require_entry(const std::string &session_id) const;
        std::shared_ptr<Entry> detach_entry(const std::string &session_id);

        void load_existing();
        void persist_locked(const SessionSnapshot &state) const;
        void remove_persisted(const std::string &session_id) const;
        std::filesystem::path state_path(const std::string &session_id) const;

        std::optional<std::filesystem::path> state_dir_;
        const ChunkStore *store_;

        mutable std::mutex registry_mutex_;
        std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
        std::unordered_map<std::string, Tombstone> tombstones_;
        std::uint64_t next_generation_{1};
    };

} // namespace chunkwise::server
