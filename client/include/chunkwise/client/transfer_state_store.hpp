#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkwise::client
{

    /// Remembers the server session of every unfinished upload so a rerun resumes it.
    class TransferStateStore
    {
    public:
        struct Entry
        {
            std::string endpoint;
            std::filesystem::path local_path;
            std::uint64_t total_size{};
            std::uint64_t chunk_size{};
            std::string session_id;
        };

        TransferStateStore();
        explicit TransferStateStore(std::filesystem::path state_path);

        /// Matches only when the file still has the recorded size and chunking.
        std::optional<Entry> find(const std::string &endpoint, const std::filesystem::path &local_path,
                                  std::uint64_t total_size, std::uint64_t chunk_size) const;

        void upsert(Entry entry);

        void remove(const std::string &endpoint, const std::filesystem::path &local_path);

        const std::vector<Entry> &entries() const noexcept { return entries_; }

        const std::filesystem::path &state_path() const noexcept { return state_path_; }

    private:
        static std::filesystem::path default_state_path();
        void load();
        void save() const;
        std::vector<Entry>::iterator find_entry(const std::string &endpoint, const std::filesystem::path &local_path);
        static std::filesystem::path normalize_path(const std::filesystem::path &path);

        std::filesystem::path state_path_;
        std::vector<Entry> entries_;
    };

} // namespace chunkwise::client
