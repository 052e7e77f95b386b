#pragma once

#include <nlohmann/json.hpp>

#include "chunkwise/protocol.hpp"

namespace chunkwise::server
{

    class UploadCoordinator;

    /// Maps protocol requests onto the coordinator and failures onto error envelopes. Never throws.
    class RequestRouter
    {
    public:
        explicit RequestRouter(UploadCoordinator &coordinator);

        /// Decodes the envelope first; malformed envelopes yield InvalidCommand or InvalidPayload.
        protocol::ResponseEnvelope handle(const nlohmann::json &message) noexcept;

        protocol::ResponseEnvelope handle(const protocol::RequestEnvelope &request) noexcept;

    private:
        nlohmann::json dispatch(const protocol::RequestEnvelope &request);

        nlohmann::json handle_upload_chunk(const nlohmann::json &payload);

        UploadCoordinator &coordinator_;
    };

} // namespace chunkwise::server
