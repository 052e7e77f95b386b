#include "chunkwise/client/transfer_state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace chunkwise::client
{

    TransferStateStore::TransferStateStore() : TransferStateStore(default_state_path()) {}

    TransferStateStore::TransferStateStore(std::filesystem::path state_path) : state_path_(std::move(state_path))
    {
        load();
    }

    std::optional<TransferStateStore::Entry> TransferStateStore::find(const std::string &endpoint,
                                                                      const std::filesystem::path &local_path,
                                                                      std::uint64_t total_size,
                                                                      std::uint64_t chunk_size) const
    {
        const auto normalized = normalize_path(local_path);
        for (const auto &entry : entries_)
        {
            if (entry.endpoint == endpoint && entry.local_path == normalized && entry.total_size == total_size &&
                entry.chunk_size == chunk_size)
            {
                return entry;
            }
        }
        return std::nullopt;
    }

    void TransferStateStore::upsert(Entry entry)
    {
        entry.local_path = normalize_path(entry.local_path);
        auto it = find_entry(entry.endpoint, entry.local_path);
        if (it == entries_.end())
        {
            entries_.push_back(std::move(entry));
        }
        else
        {
            *it = std::move(entry);
        }
        save();
    }

    void TransferStateStore::remove(const std::string &endpoint, const std::filesystem::path &local_path)
    {
        auto it = find_entry(endpoint, normalize_path(local_path));
        if (it != entries_.end())
        {
            entries_.erase(it);
            save();
        }
    }

    std::filesystem::path TransferStateStore::default_state_path()
    {
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "Chunkwise" / "sessions.json";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".chunkwise" / "sessions.json";
        }
        return std::filesystem::path(".chunkwise") / "sessions.json";
    }

    void TransferStateStore::load()
    {
        entries_.clear();
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            return;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_array())
        {
            return;
        }
        for (const auto &item : json)
        {
            if (!item.is_object())
            {
                continue;
            }
            Entry entry;
            entry.endpoint = item.value("endpoint", std::string{});
            entry.local_path = normalize_path(std::filesystem::path(item.value("local", std::string{})));
            entry.total_size = item.value("total", 0ULL);
            entry.chunk_size = item.value("chunk_size", 0ULL);
            entry.session_id = item.value("session_id", std::string{});
            if (!entry.endpoint.empty() && !entry.session_id.empty())
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void TransferStateStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::filesystem::create_directories(dir);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"endpoint", entry.endpoint},
                            {"local", entry.local_path.generic_string()},
                            {"total", entry.total_size},
                            {"chunk_size", entry.chunk_size},
                            {"session_id", entry.session_id}});
        }
        std::ofstream out(state_path_, std::ios::trunc);
        out << json.dump(2);
        if (!out)
        {
            throw std::runtime_error("Failed to write " + state_path_.string());
        }
    }

    std::vector<TransferStateStore::Entry>::iterator TransferStateStore::find_entry(
        const std::string &endpoint, const std::filesystem::path &local_path)
    {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                            { return entry.endpoint == endpoint && entry.local_path == local_path; });
    }

    std::filesystem::path TransferStateStore::normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace chunkwise::client
