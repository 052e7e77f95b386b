#include "chunkwise/server/connection.hpp"

#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <spdlog/spdlog.h>

#include "chunkwise/server/request_router.hpp"

namespace chunkwise::server
{

    Connection::Connection(asio::ip::tcp::socket socket, asio::any_io_executor workers, RequestRouter &router)
        : socket_(std::move(socket)), workers_(std::move(workers)), router_(router)
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        endpoint_ = ec ? std::string{"unknown"} : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Connection::~Connection()
    {
        spdlog::debug("Connection {} released", endpoint_);
    }

    void Connection::start()
    {
        spdlog::info("Client connected from {}", endpoint_);
        auto self = shared_from_this();
        asio::post(socket_.get_executor(), [this, self]
                   { read_frame_header(); });
    }

    void Connection::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", endpoint_);
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Connection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const auto payload_size = protocol::decode_frame_header(header_buffer_);
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             if (payload_size > protocol::kMaxFramePayload)
                             {
                                 spdlog::warn("{} sent an oversized frame ({} bytes)", endpoint_, payload_size);
                                 stop();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Connection::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             asio::post(workers_, [self, payload = std::move(buffer_)]() mutable
                                        { self->process_message(std::move(payload)); });
                             buffer_ = {};
                             read_frame_header();
                         });
    }

    void Connection::process_message(std::vector<std::uint8_t> payload)
    {
        auto message = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
        if (message.is_discarded())
        {
            protocol::ResponseEnvelope envelope;
            envelope.kind = protocol::ResponseKind::Error;
            envelope.error = chunkwise::ErrorCode::InvalidPayload;
            envelope.message = "Malformed JSON";
            send_response(envelope);
            return;
        }
        if (message.is_object())
        {
            spdlog::debug("{} -> command {}", endpoint_, message.value("cmd", std::string{"?"}));
        }
        send_response(router_.handle(message));
    }

    void Connection::send_response(const protocol::ResponseEnvelope &envelope)
    {
        auto frame = protocol::encode_frame(nlohmann::json(envelope));
        auto self = shared_from_this();
        asio::post(socket_.get_executor(), [this, self, frame = std::move(frame)]() mutable
                   {
            if (stopped_)
            {
                return;
            }
            write_queue_.push_back(std::move(frame));
            if (write_queue_.size() == 1)
            {
                write_next();
            } });
    }

    void Connection::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(write_queue_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  write_queue_.clear();
                                  stop();
                                  return;
                              }
                              write_queue_.pop_front();
                              if (!write_queue_.empty())
                              {
                                  write_next();
                              }
                          });
    }

} // namespace chunkwise::server
