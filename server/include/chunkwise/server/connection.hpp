#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>

#include "chunkwise/framing.hpp"
#include "chunkwise/protocol.hpp"

namespace chunkwise::server
{

    class RequestRouter;

    /**
     * One client connection.
     *
     * Frames are read one after another; each decoded request is handed to the
     * worker executor so requests pipelined on one connection run in parallel.
     * The socket's executor must be a strand: every socket operation and the
     * write queue live on it.
     */
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, asio::any_io_executor workers, RequestRouter &router);
        ~Connection();

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(std::vector<std::uint8_t> payload);
        void send_response(const protocol::ResponseEnvelope &envelope);
        void write_next();

        asio::ip::tcp::socket socket_;
        asio::any_io_executor workers_;
        RequestRouter &router_;
        std::string endpoint_;

        std::array<std::uint8_t, protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<std::vector<std::uint8_t>> write_queue_;
        bool stopped_{false};
    };

} // namespace chunkwise::server
