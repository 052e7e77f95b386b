/**
 * Chunkwise - Error codes shared by the upload server and the client driver.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunkwise
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        InvalidChunk = 3,
        SessionConflict = 4,
        UnknownSession = 5,
        SizeMismatch = 6,
        ChecksumMismatch = 7,
        AssemblyFailed = 8,
        UploadRejected = 9,
        StorageError = 10,
        Busy = 11,
        Timeout = 12,
        Unsupported = 13,
        InternalError = 14,
        NetworkError = 15
    };

    /// How a caller should react to a failed upload.
    enum class FailureClass : std::uint8_t
    {
        None,
        RetryAutomatically,
        RestartUpload,
        ContactSupport
    };

    std::string_view to_string(ErrorCode code) noexcept;
    std::string_view to_string(FailureClass failure) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    FailureClass classify(ErrorCode code) noexcept;

    /// True for codes the client driver retries with backoff.
    bool is_transient(ErrorCode code) noexcept;

} // namespace chunkwise
