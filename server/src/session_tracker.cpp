#include "chunkwise/server/session_tracker.hpp"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkwise/server/chunk_store.hpp"
#include "chunkwise/server/upload_error.hpp"

namespace chunkwise::server
{

    namespace
    {
        constexpr auto kStateExtension = ".json";

        std::int64_t to_seconds(Clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

        Clock::time_point from_seconds(std::int64_t seconds)
        {
            return Clock::time_point{std::chrono::seconds{seconds}};
        }

        SessionPhase phase_from_string(std::string_view value)
        {
            if (value == "assembly_failed")
            {
                return SessionPhase::AssemblyFailed;
            }
            // An assembly interrupted by a restart is retried from scratch.
            return SessionPhase::Receiving;
        }

        nlohmann::json to_json(const SessionSnapshot &state)
        {
            nlohmann::json json = {
                {"session_id", state.session_id},
                {"file_name", state.parameters.file_name},
                {"total_size", state.parameters.total_size},
                {"chunk_size", state.parameters.chunk_size},
                {"received", state.received},
                {"phase", to_string(state.phase)},
                {"created_at", to_seconds(state.created_at)},
                {"last_activity_at", to_seconds(state.last_activity_at)},
            };
            if (state.parameters.checksum)
            {
                json["checksum"] = *state.parameters.checksum;
            }
            return json;
        }

        SessionSnapshot state_from_json(const nlohmann::json &json)
        {
            SessionSnapshot state{};
            state.session_id = json.at("session_id").get<std::string>();
            state.parameters.file_name = json.at("file_name").get<std::string>();
            state.parameters.total_size = json.at("total_size").get<std::uint64_t>();
            state.parameters.chunk_size = json.at("chunk_size").get<std::uint64_t>();
            if (auto it = json.find("checksum"); it != json.end())
            {
                state.parameters.checksum = it->get<std::string>();
            }
            state.total_chunks = state.parameters.layout().total_chunks();
            state.received = json.value("received", std::set<std::uint64_t>{});
            state.phase = phase_from_string(json.value("phase", std::string{}));
            state.created_at = from_seconds(json.value("created_at", 0LL));
            state.last_activity_at = from_seconds(json.value("last_activity_at", 0LL));
            return state;
        }

    } // namespace

    bool SessionParameters::same_shape(const SessionParameters &other) const noexcept
    {
        return file_name == other.file_name && total_size == other.total_size && chunk_size == other.chunk_size;
    }

    std::string_view to_string(SessionPhase phase) noexcept
    {
        switch (phase)
        {
        case SessionPhase::Receiving:
            return "receiving";
        case SessionPhase::Assembling:
            return "assembling";
        case SessionPhase::AssemblyFailed:
            return "assembly_failed";
        }
        return "unknown";
    }

    std::set<std::uint64_t> SessionSnapshot::missing() const
    {
        std::set<std::uint64_t> result;
        for (std::uint64_t index = 0; index < total_chunks; ++index)
        {
            if (!received.contains(index))
            {
                result.insert(result.end(), index);
            }
        }
        return result;
    }

    std::uint64_t SessionSnapshot::received_bytes() const
    {
        const auto layout = parameters.layout();
        std::uint64_t bytes = 0;
        for (const auto index : received)
        {
            bytes += layout.chunk_length(index);
        }
        return bytes;
    }

    SessionTracker::SessionTracker(std::optional<std::filesystem::path> state_dir, const ChunkStore *store)
        : state_dir_(std::move(state_dir)), store_(store)
    {
        if (state_dir_)
        {
            std::filesystem::create_directories(*state_dir_);
            load_existing();
        }
    }

    CreateResult SessionTracker::create_or_resume(const std::string &session_id, const SessionParameters &parameters,
                                                  Clock::time_point now)
    {
        for (;;)
        {
            std::shared_ptr<Entry> entry;
            bool created = false;
            {
                std::lock_guard lock(registry_mutex_);
                tombstones_.erase(session_id);
                if (auto it = sessions_.find(session_id); it != sessions_.end())
                {
                    entry = it->second;
                }
                else
                {
                    entry = std::make_shared<Entry>();
                    entry->state.session_id = session_id;
                    entry->state.parameters = parameters;
                    entry->state.total_chunks = parameters.layout().total_chunks();
                    entry->state.created_at = now;
                    entry->state.last_activity_at = now;
                    entry->state.generation = next_generation_++;
                    sessions_.emplace(session_id, entry);
                    created = true;
                }
            }

            std::lock_guard lock(entry->mutex);
            if (entry->removed)
            {
                continue;
            }
            if (created)
            {
                persist_locked(entry->state);
                return {.snapshot = entry->state, .resumed = false};
            }
            if (!entry->state.parameters.same_shape(parameters))
            {
                throw UploadError(chunkwise::ErrorCode::SessionConflict,
                                  "Session " + session_id + " exists with different file name, size or chunk size");
            }
            if (!entry->state.parameters.checksum && parameters.checksum)
            {
                entry->state.parameters.checksum = parameters.checksum;
            }
            entry->state.last_activity_at = now;
            persist_locked(entry->state);
            return {.snapshot = entry->state, .resumed = true};
        }
    }

    bool SessionTracker::contains(const std::string &session_id) const
    {
        return find_entry(session_id) != nullptr;
    }

    SessionSnapshot SessionTracker::snapshot(const std::string &session_id) const
    {
        auto entry = require_entry(session_id);
        std::lock_guard lock(entry->mutex);
        if (entry->removed)
        {
            throw UploadError(chunkwise::ErrorCode::UnknownSession, "Unknown session " + session_id);
        }
        return entry->state;
    }

    std::optional<SessionSnapshot> SessionTracker::try_snapshot(const std::string &session_id) const
    {
        auto entry = find_entry(session_id);
        if (!entry)
        {
            return std::nullopt;
        }
        std::lock_guard lock(entry->mutex);
        if (entry->removed)
        {
            return std::nullopt;
        }
        return entry->state;
    }

    bool SessionTracker::accepts_writes(const std::string &session_id) const
    {
        auto entry = require_entry(session_id);
        std::lock_guard lock(entry->mutex);
        if (entry->removed)
        {
            throw UploadError(chunkwise::ErrorCode::UnknownSession, "Unknown session " + session_id);
        }
        return entry->state.phase != SessionPhase::Assembling;
    }

    MarkResult SessionTracker::mark_received(const std::string &session_id, std::uint64_t index, Clock::time_point now)
    {
        auto entry = require_entry(session_id);
        std::lock_guard lock(entry->mutex);
        auto &state = entry->state;
        if (entry->removed)
        {
            throw UploadError(chunkwise::ErrorCode::UnknownSession, "Unknown session " + session_id);
        }
        if (index >= state.total_chunks)
        {
            throw UploadError(chunkwise::ErrorCode::InvalidChunk, "Chunk index out of range");
        }

        MarkResult result{};
        result.newly_received = state.received.insert(index).second;
        state.last_activity_at = now;
        if (state.complete() && state.phase == SessionPhase::Receiving)
        {
            state.phase = SessionPhase::Assembling;
            result.claimed_assembly = true;
            result.claimed_snapshot = state;
        }
        if (result.newly_received || result.claimed_assembly)
        {
            persist_locked(state);
        }
        result.complete = state.complete();
        result.received_count = state.received.size();
        result.total_chunks = state.total_chunks;
        return result;
    }

    bool SessionTracker::is_complete(const std::string &session_id) const
    {
        return snapshot(session_id).complete();
    }

    std::set<std::uint64_t> SessionTracker::missing(const std::string &session_id) const
    {
        return snapshot(session_id).missing();
    }

    std::optional<SessionSnapshot> SessionTracker::claim_assembly(const std::string &session_id)
    {
        auto entry = require_entry(session_id);
        std::lock_guard lock(entry->mutex);
        auto &state = entry->state;
        if (entry->removed || !state.complete() || state.phase == SessionPhase::Assembling)
        {
            return std::nullopt;
        }
        state.phase = SessionPhase::Assembling;
        persist_locked(state);
        return state;
    }

    AssemblyRelease SessionTracker::mark_assembled(const SessionSnapshot &claimed, Clock::time_point now)
    {
        const auto &session_id = claimed.session_id;
        auto entry = find_entry(session_id);
        if (!entry)
        {
            return AssemblyRelease::Orphaned;
        }
        std::lock_guard lock(entry->mutex);
        if (entry->state.generation != claimed.generation)
        {
            return AssemblyRelease::Superseded;
        }
        if (entry->removed)
        {
            return AssemblyRelease::Orphaned;
        }
        remove_persisted(session_id);
        {
            // Session mutex before registry mutex, never the reverse.
            std::lock_guard registry_lock(registry_mutex_);
            tombstones_[session_id] = Tombstone{
                .parameters = entry->state.parameters,
                .total_chunks = entry->state.total_chunks,
                .assembled_at = now,
            };
            if (auto it = sessions_.find(session_id); it != sessions_.end() && it->second == entry)
            {
                sessions_.erase(it);
            }
        }
        entry->removed = true;
        return AssemblyRelease::Applied;
    }

    AssemblyRelease SessionTracker::mark_assembly_failed(const SessionSnapshot &claimed)
    {
        auto entry = find_entry(claimed.session_id);
        if (!entry)
        {
            return AssemblyRelease::Orphaned;
        }
        std::lock_guard lock(entry->mutex);
        if (entry->state.generation != claimed.generation)
        {
            return AssemblyRelease::Superseded;
        }
        if (entry->removed)
        {
            return AssemblyRelease::Orphaned;
        }
        entry->state.phase = SessionPhase::AssemblyFailed;
        persist_locked(entry->state);
        return AssemblyRelease::Applied;
    }

    RemoveResult SessionTracker::remove(const std::string &session_id)
    {
        auto entry = detach_entry(session_id);
        if (!entry)
        {
            return {};
        }
        RemoveResult result{.existed = true};
        {
            std::lock_guard lock(entry->mutex);
            entry->removed = true;
            result.was_assembling = entry->state.phase == SessionPhase::Assembling;
        }
        remove_persisted(session_id);
        return result;
    }

    std::optional<Tombstone> SessionTracker::tombstone(const std::string &session_id) const
    {
        std::lock_guard lock(registry_mutex_);
        if (auto it = tombstones_.find(session_id); it != tombstones_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    std::vector<std::string> SessionTracker::collect_expired(Clock::time_point now, std::chrono::seconds timeout)
    {
        std::vector<std::pair<std::string, std::shared_ptr<Entry>>> candidates;
        {
            std::lock_guard lock(registry_mutex_);
            candidates.reserve(sessions_.size());
            for (const auto &[id, entry] : sessions_)
            {
                candidates.emplace_back(id, entry);
            }
            std::erase_if(tombstones_, [&](const auto &item)
                          { return now - item.second.assembled_at > timeout; });
        }

        std::vector<std::string> expired;
        for (const auto &[id, entry] : candidates)
        {
            std::lock_guard lock(entry->mutex);
            if (entry->removed || entry->state.phase == SessionPhase::Assembling)
            {
                continue;
            }
            if (now - entry->state.last_activity_at > timeout)
            {
                entry->removed = true;
                expired.push_back(id);
            }
        }

        for (const auto &id : expired)
        {
            remove_persisted(id);
            std::lock_guard lock(registry_mutex_);
            if (auto it = sessions_.find(id); it != sessions_.end() && it->second->removed)
            {
                sessions_.erase(it);
            }
        }
        return expired;
    }

    std::size_t SessionTracker::size() const
    {
        std::lock_guard lock(registry_mutex_);
        return sessions_.size();
    }

    std::shared_ptr<SessionTracker::Entry> SessionTracker::find_entry(const std::string &session_id) const
    {
        std::lock_guard lock(registry_mutex_);
        if (auto it = sessions_.find(session_id); it != sessions_.end())
        {
            return it->second;
        }
        return nullptr;
    }

    std::shared_ptr<SessionTracker::Entry> SessionTracker::require_entry(const std::string &session_id) const
    {
        auto entry = find_entry(session_id);
        if (!entry)
        {
            throw UploadError(chunkwise::ErrorCode::UnknownSession, "Unknown session " + session_id);
        }
        return entry;
    }

    std::shared_ptr<SessionTracker::Entry> SessionTracker::detach_entry(const std::string &session_id)
    {
        std::lock_guard lock(registry_mutex_);
        tombstones_.erase(session_id);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            return nullptr;
        }
        auto entry = it->second;
        sessions_.erase(it);
        return entry;
    }

    void SessionTracker::load_existing()
    {
        for (const auto &file : std::filesystem::directory_iterator(*state_dir_))
        {
            if (!file.is_regular_file() || file.path().extension() != kStateExtension)
            {
                continue;
            }
            std::ifstream in(file.path());
            if (!in.is_open())
            {
                spdlog::warn("Skipping unreadable session state {}", file.path().string());
                continue;
            }
            SessionSnapshot state;
            try
            {
                nlohmann::json json;
                in >> json;
                state = state_from_json(json);
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Skipping corrupt session state {}: {}", file.path().string(), ex.what());
                continue;
            }
            catch (const std::invalid_argument &ex)
            {
                spdlog::warn("Skipping invalid session state {}: {}", file.path().string(), ex.what());
                continue;
            }

            if (store_)
            {
                std::erase_if(state.received, [&](std::uint64_t index)
                              { return index >= state.total_chunks || !store_->has_chunk(state.session_id, index); });
            }
            spdlog::info("Restored session {} ({}/{} chunks)", state.session_id, state.received.size(),
                         state.total_chunks);
            auto entry = std::make_shared<Entry>();
            entry->state = std::move(state);
            entry->state.generation = next_generation_++;
            sessions_[entry->state.session_id] = std::move(entry);
        }
    }

    void SessionTracker::persist_locked(const SessionSnapshot &state) const
    {
        if (!state_dir_)
        {
            return;
        }
        const auto path = state_path(state.session_id);
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            out << to_json(state).dump(2);
            if (!out)
            {
                throw UploadError(chunkwise::ErrorCode::StorageError,
                                  "Failed to persist session state for " + state.session_id);
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            throw UploadError(chunkwise::ErrorCode::StorageError, "Failed to persist session state: " + ec.message());
        }
    }

    void SessionTracker::remove_persisted(const std::string &session_id) const
    {
        if (!state_dir_)
        {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(state_path(session_id), ec);
        if (ec)
        {
            spdlog::warn("Failed to remove session state for {}: {}", session_id, ec.message());
        }
    }

    std::filesystem::path SessionTracker::state_path(const std::string &session_id) const
    {
        return *state_dir_ / (session_id + kStateExtension);
    }

} // namespace chunkwise::server
