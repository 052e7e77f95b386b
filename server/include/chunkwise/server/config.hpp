#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkwise::server
{

    struct UploadLimits
    {
        /// Zero disables the limit.
        std::uint64_t max_file_size{1024ULL * 1024 * 1024};
        std::uint64_t max_chunk_size{32ULL * 1024 * 1024};
        /// Used when a client begins a session with chunk_size 0.
        std::uint64_t default_chunk_size{1ULL << 20};
        /// Lowercase extensions without the dot; empty accepts every file type.
        std::vector<std::string> allowed_extensions;
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::chrono::seconds session_timeout{std::chrono::seconds{3600}};
        std::chrono::seconds reap_interval{std::chrono::seconds{60}};
        UploadLimits limits{};
        bool per_session_directory{true};
        bool persist_sessions{true};
        bool verify_checksums{true};
        std::optional<std::filesystem::path> log_file;
    };

} // namespace chunkwise::server
