#include "chunkwise/error_codes.hpp"

#include <array>

namespace chunkwise
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            FailureClass failure;
        };

        constexpr std::array<ErrorCodeDescription, 16> kDescriptions{{
            {ErrorCode::Ok, "ok", FailureClass::None},
            {ErrorCode::InvalidCommand, "invalid_command", FailureClass::ContactSupport},
            {ErrorCode::InvalidPayload, "invalid_payload", FailureClass::ContactSupport},
            {ErrorCode::InvalidChunk, "invalid_chunk", FailureClass::ContactSupport},
            {ErrorCode::SessionConflict, "session_conflict", FailureClass::RestartUpload},
            {ErrorCode::UnknownSession, "unknown_session", FailureClass::RestartUpload},
            {ErrorCode::SizeMismatch, "size_mismatch", FailureClass::RetryAutomatically},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch", FailureClass::RetryAutomatically},
            {ErrorCode::AssemblyFailed, "assembly_failed", FailureClass::RetryAutomatically},
            {ErrorCode::UploadRejected, "upload_rejected", FailureClass::ContactSupport},
            {ErrorCode::StorageError, "storage_error", FailureClass::RetryAutomatically},
            {ErrorCode::Busy, "busy", FailureClass::RetryAutomatically},
            {ErrorCode::Timeout, "timeout", FailureClass::RetryAutomatically},
            {ErrorCode::Unsupported, "unsupported", FailureClass::ContactSupport},
            {ErrorCode::InternalError, "internal_error", FailureClass::RetryAutomatically},
            {ErrorCode::NetworkError, "network_error", FailureClass::RetryAutomatically},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::string_view to_string(FailureClass failure) noexcept
    {
        switch (failure)
        {
        case FailureClass::None:
            return "none";
        case FailureClass::RetryAutomatically:
            return "retry_automatically";
        case FailureClass::RestartUpload:
            return "restart_upload";
        case FailureClass::ContactSupport:
            return "contact_support";
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    FailureClass classify(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.failure;
            }
        }
        return FailureClass::ContactSupport;
    }

    bool is_transient(ErrorCode code) noexcept
    {
        // Assembly-time integrity failures are handled by the re-send path, not by chunk retries.
        return classify(code) == FailureClass::RetryAutomatically && code != ErrorCode::AssemblyFailed &&
               code != ErrorCode::SizeMismatch;
    }

} // namespace chunkwise
