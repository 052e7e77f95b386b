#include "chunkwise/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkwise/server/connection.hpp"

namespace chunkwise::server
{

    namespace
    {

        constexpr auto kStateDirectory = ".chunkwise";

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        std::optional<std::filesystem::path> tracker_directory(const ServerConfig &config)
        {
            if (!config.persist_sessions)
            {
                return std::nullopt;
            }
            return config.root / kStateDirectory / "sessions";
        }

        std::unique_ptr<ArtifactSink> default_sink(std::unique_ptr<ArtifactSink> sink)
        {
            if (sink)
            {
                return sink;
            }
            return std::make_unique<LoggingArtifactSink>();
        }

    } // namespace

    Server::Server(ServerConfig config, std::unique_ptr<ArtifactSink> sink)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          reap_timer_(io_context_),
          chunk_store_(config_.root / kStateDirectory / "chunks"),
          tracker_(tracker_directory(config_), &chunk_store_),
          engine_(chunk_store_, AssemblyOptions{
                                    .output_root = config_.root,
                                    .per_session_directory = config_.per_session_directory,
                                    .verify_checksum = config_.verify_checksums,
                                }),
          sink_(default_sink(std::move(sink))),
          coordinator_(chunk_store_, tracker_, engine_, *sink_, config_.limits, config_.session_timeout),
          router_(coordinator_)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {}", config_.address, port(), config_.root.string());
        if (tracker_.size() > 0)
        {
            spdlog::info("Resumable sessions restored: {}", tracker_.size());
        }

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        schedule_reap();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
    }

    void Server::shutdown()
    {
        asio::post(io_context_, [this]
                   { handle_signal(); });
    }

    std::uint16_t Server::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            auto connection = std::make_shared<Connection>(std::move(socket), io_context_.get_executor(), router_);
            connection->start();
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::schedule_reap()
    {
        reap_timer_.expires_after(config_.reap_interval);
        reap_timer_.async_wait([this](const std::error_code &ec)
                               {
            if (ec)
            {
                return;
            }
            try
            {
                const auto reaped = coordinator_.reap_expired();
                if (reaped > 0)
                {
                    spdlog::info("Reaped {} idle sessions", reaped);
                }
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Reaper failed: {}", ex.what());
            }
            schedule_reap(); });
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        reap_timer_.cancel();
        signals_.cancel(ec);
        io_context_.stop();
        spdlog::info("Shutting down");
    }

} // namespace chunkwise::server
