#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "chunkwise/server/artifact_sink.hpp"
#include "chunkwise/server/assembly_engine.hpp"
#include "chunkwise/server/chunk_store.hpp"
#include "chunkwise/server/config.hpp"
#include "chunkwise/server/request_router.hpp"
#include "chunkwise/server/session_tracker.hpp"
#include "chunkwise/server/upload_coordinator.hpp"

namespace chunkwise::server
{

    class Server
    {
    public:
        /// Binds immediately; a null sink logs completed artifacts.
        explicit Server(ServerConfig config, std::unique_ptr<ArtifactSink> sink = nullptr);

        /// Blocks until shutdown() or SIGINT/SIGTERM.
        void run();

        /// Safe to call from any thread.
        void shutdown();

        std::uint16_t port() const;

        UploadCoordinator &coordinator() { return coordinator_; }

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void schedule_reap();
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer reap_timer_;

        FilesystemChunkStore chunk_store_;
        SessionTracker tracker_;
        AssemblyEngine engine_;
        std::unique_ptr<ArtifactSink> sink_;
        UploadCoordinator coordinator_;
        RequestRouter router_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkwise::server
