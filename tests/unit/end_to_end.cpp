#include <cassert>
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "chunkwise/client/chunk_source.hpp"
#include "chunkwise/client/tcp_transport.hpp"
#include "chunkwise/client/upload_driver.hpp"
#include "chunkwise/encoding/base64.hpp"
#include "chunkwise/framing.hpp"
#include "chunkwise/server/artifact_sink.hpp"
#include "chunkwise/server/config.hpp"
#include "chunkwise/server/server.hpp"
#include "test_support.hpp"

using namespace chunkwise;
using chunkwise::test::TempDir;
using chunkwise::test::make_payload;
using chunkwise::test::read_file;
using chunkwise::test::slice;

namespace
{

    class RecordingSink final : public server::ArtifactSink
    {
    public:
        explicit RecordingSink(std::shared_ptr<std::vector<server::AssembledArtifact>> artifacts,
                               std::shared_ptr<std::mutex> mutex)
            : artifacts_(std::move(artifacts)), mutex_(std::move(mutex))
        {
        }

        void deliver(const server::AssembledArtifact &artifact) override
        {
            std::lock_guard lock(*mutex_);
            artifacts_->push_back(artifact);
        }

    private:
        std::shared_ptr<std::vector<server::AssembledArtifact>> artifacts_;
        std::shared_ptr<std::mutex> mutex_;
    };

    /// Server running its event loop on a background thread for the lifetime of the object.
    class RunningServer
    {
    public:
        explicit RunningServer(const std::filesystem::path &root)
            : artifacts_(std::make_shared<std::vector<server::AssembledArtifact>>()),
              mutex_(std::make_shared<std::mutex>())
        {
            server::ServerConfig config;
            config.address = "127.0.0.1";
            config.port = 0;
            config.root = root;
            config.worker_threads = 4;
            server_ = std::make_unique<server::Server>(config, std::make_unique<RecordingSink>(artifacts_, mutex_));
            thread_ = std::thread([this]
                                  { server_->run(); });
        }

        ~RunningServer()
        {
            stop();
        }

        void stop()
        {
            if (!server_)
            {
                return;
            }
            server_->shutdown();
            if (thread_.joinable())
            {
                thread_.join();
            }
            server_.reset();
        }

        std::uint16_t port() const { return server_->port(); }

        std::vector<server::AssembledArtifact> artifacts() const
        {
            std::lock_guard lock(*mutex_);
            return *artifacts_;
        }

    private:
        std::shared_ptr<std::vector<server::AssembledArtifact>> artifacts_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_ptr<server::Server> server_;
        std::thread thread_;
    };

    client::DriverConfig tcp_config(std::uint64_t chunk_size)
    {
        client::DriverConfig config;
        config.chunk_size = chunk_size;
        config.parallelism = 3;
        config.retry.initial_backoff = std::chrono::milliseconds{10};
        config.request_timeout = std::chrono::seconds{10};
        return config;
    }

    protocol::ResponseEnvelope call(client::TcpTransport &transport, protocol::Command command,
                                    nlohmann::json payload)
    {
        return transport.call(command, std::move(payload), std::chrono::seconds{10}).get();
    }

    void test_upload_over_tcp()
    {
        TempDir dir("e2e_upload");
        RunningServer server(dir.path());
        client::TcpTransport transport("127.0.0.1", server.port());

        const auto data = make_payload(2500000, 41);
        client::UploadDriver driver(transport, std::make_shared<client::MemoryChunkSource>("video.mp4", data),
                                    tcp_config(1000000));
        std::uint64_t last_progress = 0;
        driver.on_progress([&](std::uint64_t done, std::uint64_t)
                           { last_progress = done; });

        const auto outcome = driver.start().get();
        assert(outcome.status == client::UploadStatus::Completed);
        assert(last_progress == data.size());

        const auto artifacts = server.artifacts();
        assert(artifacts.size() == 1);
        assert(artifacts[0].session_id == outcome.session_id);
        assert(artifacts[0].final_path == dir.path() / outcome.session_id / "video.mp4");
        assert(read_file(artifacts[0].final_path) == data);
    }

    void test_pipelined_requests_are_correlated()
    {
        TempDir dir("e2e_pipeline");
        RunningServer server(dir.path());
        client::TcpTransport transport("127.0.0.1", server.port());

        std::vector<std::future<protocol::ResponseEnvelope>> pings;
        for (int i = 0; i < 16; ++i)
        {
            pings.push_back(transport.call(protocol::Command::Ping, nlohmann::json::object(), std::chrono::seconds{10}));
        }
        auto unknown = transport.call(protocol::Command::QueryMissing, {{"session_id", "nobody"}},
                                      std::chrono::seconds{10});
        for (auto &ping : pings)
        {
            assert(ping.get().kind == protocol::ResponseKind::Ok);
        }
        const auto missing = unknown.get();
        assert(missing.kind == protocol::ResponseKind::Error);
        assert(missing.error == ErrorCode::UnknownSession);

        const auto bad = call(transport, protocol::Command::BeginSession, {{"file_name", "x.bin"}});
        assert(bad.error == ErrorCode::InvalidPayload);
    }

    void test_resume_across_server_restart()
    {
        TempDir dir("e2e_restart");
        const auto data = make_payload(300000, 42);
        constexpr std::uint64_t kChunk = 100000;

        {
            RunningServer first(dir.path());
            client::TcpTransport transport("127.0.0.1", first.port());
            const auto begin = call(transport, protocol::Command::BeginSession,
                                    protocol::BeginSessionRequest{
                                        .file_name = "restart.bin",
                                        .total_size = data.size(),
                                        .chunk_size = kChunk,
                                        .session_id = "restart-1",
                                    });
            assert(begin.kind == protocol::ResponseKind::Ok);
            const auto chunk = call(transport, protocol::Command::UploadChunk,
                                    protocol::UploadChunkRequest{
                                        .session_id = "restart-1",
                                        .index = 1,
                                        .total_chunks = 3,
                                        .chunk_size = kChunk,
                                        .file_name = "restart.bin",
                                        .total_size = data.size(),
                                        .data_base64 = encoding::encode_base64(slice(data, kChunk, kChunk)),
                                    });
            assert(chunk.kind == protocol::ResponseKind::Ok);
            assert(chunk.payload.at("received_chunks") == 1);
        }

        RunningServer second(dir.path());
        client::TcpTransport transport("127.0.0.1", second.port());
        const auto status = call(transport, protocol::Command::SessionStatus, {{"session_id", "restart-1"}});
        assert(status.kind == protocol::ResponseKind::Ok);
        assert(status.payload.at("received_chunks") == 1);

        std::vector<std::uint64_t> reported;
        client::UploadDriver driver(transport, std::make_shared<client::MemoryChunkSource>("restart.bin", data),
                                    tcp_config(kChunk));
        driver.on_progress([&](std::uint64_t done, std::uint64_t)
                           { reported.push_back(done); });
        const auto outcome = driver.start(std::string("restart-1")).get();
        assert(outcome.status == client::UploadStatus::Completed);
        assert(reported.front() == kChunk);
        assert(read_file(dir.path() / "restart-1" / "restart.bin") == data);
    }

    void test_lost_server_fails_pending_calls()
    {
        TempDir dir("e2e_lost");
        auto server = std::make_unique<RunningServer>(dir.path());
        const auto port = server->port();
        client::TcpTransport transport("127.0.0.1", port);
        assert(call(transport, protocol::Command::Ping, nlohmann::json::object()).kind == protocol::ResponseKind::Ok);

        server.reset();

        bool network_error = false;
        try
        {
            (void)call(transport, protocol::Command::Ping, nlohmann::json::object());
        }
        catch (const client::TransportError &ex)
        {
            network_error = ex.code() == ErrorCode::NetworkError;
        }
        assert(network_error);

        const auto data = make_payload(1000, 43);
        auto config = tcp_config(500);
        config.retry.max_attempts = 2;
        client::UploadDriver driver(transport, std::make_shared<client::MemoryChunkSource>("lost.bin", data), config);
        const auto outcome = driver.start().get();
        assert(outcome.status == client::UploadStatus::Failed);
        assert(outcome.error == ErrorCode::NetworkError);
        assert(outcome.failure == FailureClass::RetryAutomatically);
    }

    void test_silent_peer_times_out()
    {
        // Accepts the connection and reads nothing back.
        asio::io_context io_context;
        asio::ip::tcp::acceptor acceptor(io_context, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        asio::ip::tcp::socket peer(io_context);
        acceptor.async_accept(peer, [](const std::error_code &) {});
        std::thread io_thread([&]
                              { io_context.run(); });

        {
            client::TcpTransport transport("127.0.0.1", acceptor.local_endpoint().port());
            auto future = transport.call(protocol::Command::Ping, nlohmann::json::object(),
                                         std::chrono::milliseconds{100});
            bool timed_out = false;
            try
            {
                (void)future.get();
            }
            catch (const client::TransportError &ex)
            {
                timed_out = ex.code() == ErrorCode::Timeout;
            }
            assert(timed_out);
        }

        io_context.stop();
        io_thread.join();
    }

    void test_unframeable_request_is_rejected_locally()
    {
        // Nothing listens on the port; the request must fail before any connection attempt.
        client::TcpTransport transport("127.0.0.1", 1);
        const std::string blob(protocol::kMaxFramePayload, 'A');
        bool rejected = false;
        try
        {
            (void)transport.call(protocol::Command::UploadChunk, {{"data", blob}}, std::chrono::seconds{1});
        }
        catch (const client::TransportError &ex)
        {
            rejected = ex.code() == ErrorCode::InvalidChunk;
        }
        assert(rejected);
    }

} // namespace

void run_end_to_end_tests()
{
    test_upload_over_tcp();
    test_pipelined_requests_are_correlated();
    test_resume_across_server_restart();
    test_lost_server_fails_pending_calls();
    test_silent_peer_times_out();
    test_unframeable_request_is_rejected_locally();
    std::cout << "End-to-end tests passed\n";
}
