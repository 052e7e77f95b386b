#include "chunkwise/server/request_router.hpp"

#include <spdlog/spdlog.h>

#include "chunkwise/encoding/base64.hpp"
#include "chunkwise/server/upload_coordinator.hpp"
#include "chunkwise/server/upload_error.hpp"

namespace chunkwise::server
{

    namespace
    {

        protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                    const std::optional<std::string> &request_id)
        {
            protocol::ResponseEnvelope envelope;
            envelope.kind = protocol::ResponseKind::Ok;
            envelope.error = chunkwise::ErrorCode::Ok;
            envelope.payload = std::move(payload);
            envelope.request_id = request_id;
            return envelope;
        }

        protocol::ResponseEnvelope make_error_response(chunkwise::ErrorCode code, std::string message,
                                                       const std::optional<std::string> &request_id)
        {
            protocol::ResponseEnvelope envelope;
            envelope.kind = protocol::ResponseKind::Error;
            envelope.error = code;
            envelope.message = std::move(message);
            envelope.request_id = request_id;
            return envelope;
        }

        std::optional<std::string> request_id_of(const nlohmann::json &message)
        {
            if (message.is_object())
            {
                if (auto it = message.find("id"); it != message.end() && it->is_string())
                {
                    return it->get<std::string>();
                }
            }
            return std::nullopt;
        }

    } // namespace

    RequestRouter::RequestRouter(UploadCoordinator &coordinator) : coordinator_(coordinator) {}

    protocol::ResponseEnvelope RequestRouter::handle(const nlohmann::json &message) noexcept
    {
        const auto request_id = request_id_of(message);
        protocol::RequestEnvelope request;
        try
        {
            if (!message.is_object() || !message.contains("cmd"))
            {
                return make_error_response(chunkwise::ErrorCode::InvalidPayload, "Malformed request envelope",
                                           request_id);
            }
            const auto label = message.at("cmd").get<std::string>();
            if (!protocol::command_from_string(label))
            {
                return make_error_response(chunkwise::ErrorCode::InvalidCommand, "Unknown command: " + label,
                                           request_id);
            }
            request = message.get<protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            return make_error_response(chunkwise::ErrorCode::InvalidPayload, ex.what(), request_id);
        }
        return handle(request);
    }

    protocol::ResponseEnvelope RequestRouter::handle(const protocol::RequestEnvelope &request) noexcept
    {
        try
        {
            return make_ok_response(dispatch(request), request.request_id);
        }
        catch (const UploadError &ex)
        {
            auto response = make_error_response(ex.code(), ex.what(), request.request_id);
            if (ex.cause())
            {
                response.payload["cause"] = chunkwise::to_int(*ex.cause());
            }
            if (request.command == protocol::Command::FinalizeSession &&
                ex.code() == chunkwise::ErrorCode::InvalidChunk)
            {
                try
                {
                    const auto session_id = request.payload.at("session_id").get<std::string>();
                    const auto missing = coordinator_.query_missing_chunks(session_id);
                    response.payload["missing"] = std::vector<std::uint64_t>(missing.begin(), missing.end());
                }
                catch (const UploadError &inner)
                {
                    spdlog::debug("Missing set unavailable: {}", inner.what());
                }
            }
            spdlog::debug("{} failed: {} ({})", protocol::to_string(request.command), ex.what(),
                          chunkwise::to_string(ex.code()));
            return response;
        }
        catch (const nlohmann::json::exception &ex)
        {
            return make_error_response(chunkwise::ErrorCode::InvalidPayload, ex.what(), request.request_id);
        }
        catch (const std::invalid_argument &ex)
        {
            return make_error_response(chunkwise::ErrorCode::InvalidPayload, ex.what(), request.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} failed unexpectedly: {}", protocol::to_string(request.command), ex.what());
            return make_error_response(chunkwise::ErrorCode::InternalError, ex.what(), request.request_id);
        }
    }

    nlohmann::json RequestRouter::dispatch(const protocol::RequestEnvelope &request)
    {
        switch (request.command)
        {
        case protocol::Command::BeginSession:
        {
            const auto begin = request.payload.get<protocol::BeginSessionRequest>();
            return coordinator_.begin_or_resume_session(begin);
        }
        case protocol::Command::UploadChunk:
            return handle_upload_chunk(request.payload);
        case protocol::Command::QueryMissing:
        {
            const auto query = request.payload.get<protocol::SessionRequest>();
            const auto missing = coordinator_.query_missing_chunks(query.session_id);
            return protocol::MissingChunksResponse{
                .session_id = query.session_id,
                .missing = {missing.begin(), missing.end()},
            };
        }
        case protocol::Command::AbortSession:
        {
            const auto abort = request.payload.get<protocol::SessionRequest>();
            coordinator_.abort_session(abort.session_id);
            return nlohmann::json::object();
        }
        case protocol::Command::FinalizeSession:
        {
            const auto finalize = request.payload.get<protocol::SessionRequest>();
            return coordinator_.finalize_session(finalize.session_id);
        }
        case protocol::Command::SessionStatus:
        {
            const auto status = request.payload.get<protocol::SessionRequest>();
            return coordinator_.session_status(status.session_id);
        }
        case protocol::Command::Ping:
            return nlohmann::json::object();
        }
        throw UploadError(chunkwise::ErrorCode::Unsupported, "Command not supported");
    }

    nlohmann::json RequestRouter::handle_upload_chunk(const nlohmann::json &payload)
    {
        const auto request = payload.get<protocol::UploadChunkRequest>();
        const auto bytes = encoding::decode_base64(request.data_base64);

        std::optional<SessionParameters> declared;
        if (!request.file_name.empty() && request.chunk_size > 0)
        {
            declared = SessionParameters{
                .file_name = request.file_name,
                .total_size = request.total_size,
                .chunk_size = request.chunk_size,
                .checksum = std::nullopt,
            };
            if (declared->layout().total_chunks() != request.total_chunks)
            {
                throw UploadError(chunkwise::ErrorCode::InvalidChunk, "total_chunks disagrees with size and chunk size");
            }
        }
        return coordinator_.receive_chunk(request.session_id, request.index, bytes, declared, request.chunk_hash);
    }

} // namespace chunkwise::server
