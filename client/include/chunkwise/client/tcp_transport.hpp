#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <asio.hpp>

#include "chunkwise/client/upload_transport.hpp"
#include "chunkwise/framing.hpp"

namespace chunkwise::client
{

    /**
     * Pipelined framed-JSON client over one TCP connection.
     *
     * Requests are correlated with responses by id, so many calls may be in
     * flight at once. All socket state lives on a private io thread. A broken
     * connection fails every pending call; the next call reconnects.
     */
    class TcpTransport final : public UploadTransport
    {
    public:
        TcpTransport(std::string host, std::uint16_t port);
        ~TcpTransport() override;

        TcpTransport(const TcpTransport &) = delete;
        TcpTransport &operator=(const TcpTransport &) = delete;

        std::future<protocol::ResponseEnvelope> call(protocol::Command command, nlohmann::json payload,
                                                     std::chrono::milliseconds timeout) override;

    private:
        struct Pending
        {
            std::promise<protocol::ResponseEnvelope> promise;
            std::unique_ptr<asio::steady_timer> timer;
        };

        void start_call(std::string request_id, std::vector<std::uint8_t> frame, std::shared_ptr<Pending> pending,
                        std::chrono::milliseconds timeout);
        bool ensure_connected(std::string &error);
        void read_frame_header(std::uint64_t generation);
        void read_frame_payload(std::uint64_t generation, std::size_t size);
        void complete(const nlohmann::json &message);
        void write_next(std::uint64_t generation);
        void fail(const std::string &request_id, chunkwise::ErrorCode code, const std::string &message);
        void fail_all(chunkwise::ErrorCode code, const std::string &message);
        void disconnect(const std::string &reason);

        std::string host_;
        std::uint16_t port_;

        asio::io_context io_context_;
        asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
        asio::ip::tcp::socket socket_;
        std::thread io_thread_;

        // Touched on the io thread only.
        bool connected_{false};
        std::uint64_t generation_{0};
        std::unordered_map<std::string, std::shared_ptr<Pending>> pending_;
        std::deque<std::vector<std::uint8_t>> write_queue_;
        std::array<std::uint8_t, protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;

        std::atomic<std::uint64_t> request_counter_{0};
    };

} // namespace chunkwise::client
