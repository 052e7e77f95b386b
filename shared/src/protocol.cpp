#include "chunkwise/protocol.hpp"

#include <array>
#include <stdexcept>

namespace chunkwise::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 7> kCommandMappings{{
            {Command::BeginSession, "BEGIN_SESSION"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::QueryMissing, "QUERY_MISSING"},
            {Command::AbortSession, "ABORT_SESSION"},
            {Command::FinalizeSession, "FINALIZE_SESSION"},
            {Command::SessionStatus, "SESSION_STATUS"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        template <typename T>
        void write_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
        }

        template <typename T>
        std::optional<T> read_optional(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<T>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        write_optional(json, "id", envelope.request_id);
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_optional<std::string>(json, "id");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        write_optional(json, "id", envelope.request_id);
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_optional<std::string>(json, "id");
    }

    void to_json(nlohmann::json &json, const BeginSessionRequest &request)
    {
        json = {
            {"file_name", request.file_name},
            {"total_size", request.total_size},
            {"chunk_size", request.chunk_size},
        };
        write_optional(json, "session_id", request.session_id);
        write_optional(json, "checksum", request.checksum);
    }

    void from_json(const nlohmann::json &json, BeginSessionRequest &request)
    {
        request.file_name = json.at("file_name").get<std::string>();
        request.total_size = json.at("total_size").get<std::uint64_t>();
        request.chunk_size = json.at("chunk_size").get<std::uint64_t>();
        request.session_id = read_optional<std::string>(json, "session_id");
        request.checksum = read_optional<std::string>(json, "checksum");
    }

    void to_json(nlohmann::json &json, const SessionDescriptor &descriptor)
    {
        json = {
            {"session_id", descriptor.session_id},
            {"file_name", descriptor.file_name},
            {"total_size", descriptor.total_size},
            {"chunk_size", descriptor.chunk_size},
            {"total_chunks", descriptor.total_chunks},
            {"received", descriptor.received},
            {"resumed", descriptor.resumed},
            {"assembled", descriptor.assembled},
        };
    }

    void from_json(const nlohmann::json &json, SessionDescriptor &descriptor)
    {
        descriptor.session_id = json.at("session_id").get<std::string>();
        descriptor.file_name = json.value("file_name", std::string{});
        descriptor.total_size = json.value("total_size", 0ULL);
        descriptor.chunk_size = json.value("chunk_size", 0ULL);
        descriptor.total_chunks = json.value("total_chunks", 0ULL);
        descriptor.received = json.value("received", std::vector<std::uint64_t>{});
        descriptor.resumed = json.value("resumed", false);
        descriptor.assembled = json.value("assembled", false);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"index", request.index},
            {"total_chunks", request.total_chunks},
            {"chunk_size", request.chunk_size},
            {"file_name", request.file_name},
            {"total_size", request.total_size},
            {"data", request.data_base64},
        };
        write_optional(json, "hash", request.chunk_hash);
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.index = json.at("index").get<std::uint64_t>();
        request.total_chunks = json.value("total_chunks", 0ULL);
        request.chunk_size = json.value("chunk_size", 0ULL);
        request.file_name = json.value("file_name", std::string{});
        request.total_size = json.value("total_size", 0ULL);
        request.data_base64 = json.value("data", std::string{});
        request.chunk_hash = read_optional<std::string>(json, "hash");
    }

    void to_json(nlohmann::json &json, const ChunkAck &ack)
    {
        json = {
            {"session_id", ack.session_id},
            {"index", ack.index},
            {"complete", ack.complete},
            {"assembled", ack.assembled},
            {"received_chunks", ack.received_chunks},
            {"total_chunks", ack.total_chunks},
        };
    }

    void from_json(const nlohmann::json &json, ChunkAck &ack)
    {
        ack.session_id = json.at("session_id").get<std::string>();
        ack.index = json.value("index", 0ULL);
        ack.complete = json.value("complete", false);
        ack.assembled = json.value("assembled", false);
        ack.received_chunks = json.value("received_chunks", 0ULL);
        ack.total_chunks = json.value("total_chunks", 0ULL);
    }

    void to_json(nlohmann::json &json, const SessionRequest &request)
    {
        json = {{"session_id", request.session_id}};
    }

    void from_json(const nlohmann::json &json, SessionRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const MissingChunksResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"missing", response.missing},
        };
    }

    void from_json(const nlohmann::json &json, MissingChunksResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.missing = json.value("missing", std::vector<std::uint64_t>{});
    }

    double SessionStatusResponse::progress() const noexcept
    {
        if (total_size == 0)
        {
            return total_chunks == received_chunks ? 1.0 : 0.0;
        }
        return static_cast<double>(received_bytes) / static_cast<double>(total_size);
    }

    void to_json(nlohmann::json &json, const SessionStatusResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"file_name", response.file_name},
            {"phase", response.phase},
            {"received_chunks", response.received_chunks},
            {"total_chunks", response.total_chunks},
            {"received_bytes", response.received_bytes},
            {"total_size", response.total_size},
            {"progress", response.progress()},
        };
    }

    void from_json(const nlohmann::json &json, SessionStatusResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.file_name = json.value("file_name", std::string{});
        response.phase = json.value("phase", std::string{});
        response.received_chunks = json.value("received_chunks", 0ULL);
        response.total_chunks = json.value("total_chunks", 0ULL);
        response.received_bytes = json.value("received_bytes", 0ULL);
        response.total_size = json.value("total_size", 0ULL);
    }

} // namespace chunkwise::protocol
