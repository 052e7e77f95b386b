#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "chunkwise/error_codes.hpp"

namespace chunkwise::server
{

    /// Failure raised by the upload core; carries the protocol error code reported to the client.
    class UploadError : public std::runtime_error
    {
    public:
        UploadError(chunkwise::ErrorCode code, std::string message,
                    std::optional<chunkwise::ErrorCode> cause = std::nullopt);

        chunkwise::ErrorCode code() const noexcept { return code_; }

        /// Underlying failure for AssemblyFailed (SizeMismatch, ChecksumMismatch, StorageError).
        std::optional<chunkwise::ErrorCode> cause() const noexcept { return cause_; }

    private:
        chunkwise::ErrorCode code_;
        std::optional<chunkwise::ErrorCode> cause_;
    };

} // namespace chunkwise::server
