#include "chunkwise/client/tcp_transport.hpp"

#include <stdexcept>

namespace chunkwise::client
{

    TcpTransport::TcpTransport(std::string host, std::uint16_t port)
        : host_(std::move(host)), port_(port), work_guard_(asio::make_work_guard(io_context_)), socket_(io_context_)
    {
        io_thread_ = std::thread([this]
                                 { io_context_.run(); });
    }

    TcpTransport::~TcpTransport()
    {
        asio::post(io_context_, [this]
                   { disconnect("transport closed"); });
        work_guard_.reset();
        if (io_thread_.joinable())
        {
            io_thread_.join();
        }
    }

    std::future<protocol::ResponseEnvelope> TcpTransport::call(protocol::Command command, nlohmann::json payload,
                                                               std::chrono::milliseconds timeout)
    {
        protocol::RequestEnvelope envelope{
            .command = command,
            .payload = std::move(payload),
            .request_id = "r" + std::to_string(++request_counter_),
        };
        auto request_id = *envelope.request_id;
        std::vector<std::uint8_t> frame;
        try
        {
            frame = protocol::encode_frame(nlohmann::json(envelope));
        }
        catch (const std::length_error &ex)
        {
            throw TransportError(chunkwise::ErrorCode::InvalidChunk, ex.what());
        }

        auto pending = std::make_shared<Pending>();
        auto future = pending->promise.get_future();
        asio::post(io_context_, [this, request_id = std::move(request_id), frame = std::move(frame), pending,
                                 timeout]() mutable
                   { start_call(std::move(request_id), std::move(frame), std::move(pending), timeout); });
        return future;
    }

    void TcpTransport::start_call(std::string request_id, std::vector<std::uint8_t> frame,
                                  std::shared_ptr<Pending> pending, std::chrono::milliseconds timeout)
    {
        std::string error;
        if (!ensure_connected(error))
        {
            pending->promise.set_exception(std::make_exception_ptr(
                TransportError(chunkwise::ErrorCode::NetworkError, "Connection failed: " + error)));
            return;
        }

        pending->timer = std::make_unique<asio::steady_timer>(io_context_, timeout);
        pending->timer->async_wait([this, request_id](const std::error_code &ec)
                                   {
            if (!ec)
            {
                fail(request_id, chunkwise::ErrorCode::Timeout, "Request timed out");
            } });
        pending_.emplace(request_id, std::move(pending));

        write_queue_.push_back(std::move(frame));
        if (write_queue_.size() == 1)
        {
            write_next(generation_);
        }
    }

    bool TcpTransport::ensure_connected(std::string &error)
    {
        if (connected_)
        {
            return true;
        }
        std::error_code ec;
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(host_, std::to_string(port_), ec);
        if (!ec)
        {
            asio::connect(socket_, results, ec);
        }
        if (ec)
        {
            error = ec.message();
            std::error_code ignored;
            socket_.close(ignored);
            return false;
        }
        socket_.set_option(asio::ip::tcp::no_delay(true), ec);
        connected_ = true;
        ++generation_;
        read_frame_header(generation_);
        return true;
    }

    void TcpTransport::read_frame_header(std::uint64_t generation)
    {
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, generation](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (generation != generation_)
                             {
                                 return;
                             }
                             if (ec)
                             {
                                 disconnect(ec.message());
                                 return;
                             }
                             const auto size = protocol::decode_frame_header(header_buffer_);
                             if (size > protocol::kMaxFramePayload)
                             {
                                 disconnect("oversized response frame");
                                 return;
                             }
                             if (size == 0)
                             {
                                 read_frame_header(generation);
                                 return;
                             }
                             buffer_.resize(size);
                             read_frame_payload(generation, size);
                         });
    }

    void TcpTransport::read_frame_payload(std::uint64_t generation, std::size_t size)
    {
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, generation](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (generation != generation_)
                             {
                                 return;
                             }
                             if (ec)
                             {
                                 disconnect(ec.message());
                                 return;
                             }
                             const auto message = nlohmann::json::parse(buffer_.begin(), buffer_.end(), nullptr, false);
                             if (message.is_discarded())
                             {
                                 disconnect("malformed response frame");
                                 return;
                             }
                             complete(message);
                             read_frame_header(generation);
                         });
    }

    void TcpTransport::complete(const nlohmann::json &message)
    {
        protocol::ResponseEnvelope envelope;
        try
        {
            envelope = message.get<protocol::ResponseEnvelope>();
        }
        catch (const std::exception &ex)
        {
            disconnect(std::string("malformed response envelope: ") + ex.what());
            return;
        }
        if (!envelope.request_id)
        {
            return;
        }
        auto it = pending_.find(*envelope.request_id);
        if (it == pending_.end())
        {
            // Already timed out.
            return;
        }
        auto pending = std::move(it->second);
        pending_.erase(it);
        pending->timer->cancel();
        pending->promise.set_value(std::move(envelope));
    }

    void TcpTransport::write_next(std::uint64_t generation)
    {
        asio::async_write(socket_, asio::buffer(write_queue_.front()),
                          [this, generation](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (generation != generation_)
                              {
                                  return;
                              }
                              if (ec)
                              {
                                  disconnect(ec.message());
                                  return;
                              }
                              write_queue_.pop_front();
                              if (!write_queue_.empty())
                              {
                                  write_next(generation);
                              }
                          });
    }

    void TcpTransport::fail(const std::string &request_id, chunkwise::ErrorCode code, const std::string &message)
    {
        auto it = pending_.find(request_id);
        if (it == pending_.end())
        {
            return;
        }
        auto pending = std::move(it->second);
        pending_.erase(it);
        pending->promise.set_exception(std::make_exception_ptr(TransportError(code, message)));
    }

    void TcpTransport::fail_all(chunkwise::ErrorCode code, const std::string &message)
    {
        auto pending = std::move(pending_);
        pending_.clear();
        for (auto &[id, entry] : pending)
        {
            entry->timer->cancel();
            entry->promise.set_exception(std::make_exception_ptr(TransportError(code, message)));
        }
    }

    void TcpTransport::disconnect(const std::string &reason)
    {
        if (connected_)
        {
            std::error_code ec;
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket_.close(ec);
        }
        connected_ = false;
        ++generation_;
        write_queue_.clear();
        fail_all(chunkwise::ErrorCode::NetworkError, "Connection lost: " + reason);
    }

} // namespace chunkwise::client
