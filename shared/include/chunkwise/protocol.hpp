/**
 * Chunkwise - Upload protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkwise/error_codes.hpp"

namespace chunkwise::protocol
{

    enum class Command : std::uint8_t
    {
        BeginSession,
        UploadChunk,
        QueryMissing,
        AbortSession,
        FinalizeSession,
        SessionStatus,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct BeginSessionRequest
    {
        std::string file_name;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::optional<std::string> session_id{};
        std::optional<std::string> checksum{};
    };

    void to_json(nlohmann::json &json, const BeginSessionRequest &request);
    void from_json(const nlohmann::json &json, BeginSessionRequest &request);

    struct SessionDescriptor
    {
        std::string session_id;
        std::string file_name;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::vector<std::uint64_t> received{};
        bool resumed{};
        bool assembled{};
    };

    void to_json(nlohmann::json &json, const SessionDescriptor &descriptor);
    void from_json(const nlohmann::json &json, SessionDescriptor &descriptor);

    /// One chunk plus the session metadata needed to create the session on first contact.
    struct UploadChunkRequest
    {
        std::string session_id;
        std::uint64_t index{};
        std::uint64_t total_chunks{};
        std::uint64_t chunk_size{};
        std::string file_name;
        std::uint64_t total_size{};
        std::string data_base64;
        std::optional<std::string> chunk_hash{};
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct ChunkAck
    {
        std::string session_id;
        std::uint64_t index{};
        bool complete{};
        bool assembled{};
        std::uint64_t received_chunks{};
        std::uint64_t total_chunks{};
    };

    void to_json(nlohmann::json &json, const ChunkAck &ack);
    void from_json(const nlohmann::json &json, ChunkAck &ack);

    struct SessionRequest
    {
        std::string session_id;
    };

    void to_json(nlohmann::json &json, const SessionRequest &request);
    void from_json(const nlohmann::json &json, SessionRequest &request);

    struct MissingChunksResponse
    {
        std::string session_id;
        std::vector<std::uint64_t> missing;
    };

    void to_json(nlohmann::json &json, const MissingChunksResponse &response);
    void from_json(const nlohmann::json &json, MissingChunksResponse &response);

    struct SessionStatusResponse
    {
        std::string session_id;
        std::string file_name;
        std::string phase;
        std::uint64_t received_chunks{};
        std::uint64_t total_chunks{};
        std::uint64_t received_bytes{};
        std::uint64_t total_size{};

        double progress() const noexcept;
    };

    void to_json(nlohmann::json &json, const SessionStatusResponse &response);
    void from_json(const nlohmann::json &json, SessionStatusResponse &response);

} // namespace chunkwise::protocol
