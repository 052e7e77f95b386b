#include "upload_validation.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

#include "chunkwise/framing.hpp"
#include "chunkwise/server/upload_error.hpp"

namespace chunkwise::server::upload_validation
{

    namespace
    {
        constexpr std::size_t kMaxIdLength = 128;

        bool is_id_char(char ch)
        {
            const auto c = static_cast<unsigned char>(ch);
            return std::isalnum(c) || ch == '.' || ch == '_' || ch == '-';
        }

        std::string lowercase(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

    } // namespace

    void validate_session_id(const std::string &session_id)
    {
        if (session_id.empty() || session_id.size() > kMaxIdLength || session_id == "." || session_id == ".." ||
            !std::all_of(session_id.begin(), session_id.end(), is_id_char))
        {
            throw UploadError(chunkwise::ErrorCode::InvalidPayload, "Invalid session id");
        }
    }

    std::string sanitize_file_name(const std::string &requested)
    {
        // Browsers on Windows may send backslash separated paths.
        std::string normalized = requested;
        std::replace(normalized.begin(), normalized.end(), '\\', '/');

        std::string base;
        for (const auto &part : std::filesystem::path(normalized))
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == "." || part_string == "/")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw UploadError(chunkwise::ErrorCode::InvalidPayload, "Path traversal detected");
            }
            base = part_string;
        }
        if (base.empty() || base.find('\0') != std::string::npos)
        {
            throw UploadError(chunkwise::ErrorCode::InvalidPayload, "File name is required");
        }
        return base;
    }

    void check_file_limits(const UploadLimits &limits, const std::string &file_name, std::uint64_t total_size)
    {
        if (limits.max_file_size != 0 && total_size > limits.max_file_size)
        {
            throw UploadError(chunkwise::ErrorCode::UploadRejected,
                              "File of " + std::to_string(total_size) + " bytes exceeds the limit of " +
                                  std::to_string(limits.max_file_size));
        }
        if (limits.allowed_extensions.empty())
        {
            return;
        }
        auto extension = std::filesystem::path(file_name).extension().string();
        if (!extension.empty())
        {
            extension = lowercase(extension.substr(1));
        }
        const auto &allowed = limits.allowed_extensions;
        if (std::find(allowed.begin(), allowed.end(), extension) == allowed.end())
        {
            throw UploadError(chunkwise::ErrorCode::UploadRejected, "File type not allowed: " + file_name);
        }
    }

    void check_limits(const UploadLimits &limits)
    {
        if (limits.max_chunk_size > protocol::kMaxChunkBytes)
        {
            throw std::invalid_argument("Maximum chunk size " + std::to_string(limits.max_chunk_size) +
                                        " exceeds the framing limit of " +
                                        std::to_string(protocol::kMaxChunkBytes) + " bytes");
        }
        const auto max_chunk_size = limits.max_chunk_size == 0 ? protocol::kMaxChunkBytes : limits.max_chunk_size;
        if (limits.default_chunk_size == 0 || limits.default_chunk_size > max_chunk_size)
        {
            throw std::invalid_argument("Default chunk size " + std::to_string(limits.default_chunk_size) +
                                        " must be between 1 and " + std::to_string(max_chunk_size));
        }
    }

    std::uint64_t resolve_chunk_size(const UploadLimits &limits, std::uint64_t requested)
    {
        const auto chunk_size = requested == 0 ? limits.default_chunk_size : requested;
        const auto max_chunk_size = limits.max_chunk_size == 0 ? protocol::kMaxChunkBytes : limits.max_chunk_size;
        if (chunk_size == 0 || chunk_size > max_chunk_size)
        {
            throw UploadError(chunkwise::ErrorCode::UploadRejected,
                              "Chunk size " + std::to_string(chunk_size) + " is not accepted");
        }
        return chunk_size;
    }

} // namespace chunkwise::server::upload_validation
