#pragma once

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkwise/error_codes.hpp"
#include "chunkwise/protocol.hpp"

namespace chunkwise::client
{

    /// Request that never produced a response envelope (connection failure or timeout).
    class TransportError : public std::runtime_error
    {
    public:
        TransportError(chunkwise::ErrorCode code, const std::string &message)
            : std::runtime_error(message), code_(code)
        {
        }

        chunkwise::ErrorCode code() const noexcept { return code_; }

    private:
        chunkwise::ErrorCode code_;
    };

    class UploadTransport
    {
    public:
        virtual ~UploadTransport() = default;

        /// The future holds the response envelope, or a TransportError once `timeout` passes or the link drops.
        /// A request too large to frame throws TransportError(InvalidChunk) straight away.
        virtual std::future<protocol::ResponseEnvelope> call(protocol::Command command, nlohmann::json payload,
                                                             std::chrono::milliseconds timeout) = 0;
    };

} // namespace chunkwise::client
