#pragma once

#include <cstdint>
#include <string>

#include "chunkwise/server/config.hpp"

namespace chunkwise::server::upload_validation
{

    /// Session ids are `[A-Za-z0-9._-]{1,128}` and never `.` or `..`; throws UploadError(InvalidPayload).
    void validate_session_id(const std::string &session_id);

    /// Reduces a client supplied name to its base name; throws UploadError(InvalidPayload) on traversal.
    std::string sanitize_file_name(const std::string &requested);

    /// Extension and file size limits; throws UploadError(UploadRejected).
    void check_file_limits(const UploadLimits &limits, const std::string &file_name, std::uint64_t total_size);

    /// Rejects limits that would admit chunks too large to frame; throws std::invalid_argument.
    void check_limits(const UploadLimits &limits);

    /// Resolves chunk size 0 to the default and enforces the maximum; throws UploadError(UploadRejected).
    std::uint64_t resolve_chunk_size(const UploadLimits &limits, std::uint64_t requested);

} // namespace chunkwise::server::upload_validation
