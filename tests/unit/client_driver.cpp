#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkwise/client/cancellation.hpp"
#include "chunkwise/client/chunk_source.hpp"
#include "chunkwise/client/config.hpp"
#include "chunkwise/client/retry_policy.hpp"
#include "chunkwise/client/transfer_state_store.hpp"
#include "chunkwise/client/upload_driver.hpp"
#include "chunkwise/client/upload_transport.hpp"
#include "chunkwise/client/worker_pool.hpp"
#include "chunkwise/encoding/base64.hpp"
#include "chunkwise/framing.hpp"
#include "chunkwise/server/artifact_sink.hpp"
#include "chunkwise/server/assembly_engine.hpp"
#include "chunkwise/server/chunk_store.hpp"
#include "chunkwise/server/request_router.hpp"
#include "chunkwise/server/session_tracker.hpp"
#include "chunkwise/server/upload_coordinator.hpp"
#include "chunkwise/server/upload_error.hpp"
#include "test_support.hpp"

using namespace chunkwise;
using namespace chunkwise::client;
using chunkwise::test::TempDir;
using chunkwise::test::make_payload;
using chunkwise::test::read_file;

namespace
{

    /// In-process server stack the loopback transport talks to.
    struct ServerStack
    {
        explicit ServerStack(const std::filesystem::path &root)
            : output_root(root / "out"),
              store(root / "chunks"),
              engine(store, server::AssemblyOptions{.output_root = output_root}),
              coordinator(store, tracker, engine, sink, server::UploadLimits{}, std::chrono::seconds{3600}),
              router(coordinator)
        {
        }

        std::filesystem::path artifact(const std::string &session_id, const std::string &file_name) const
        {
            return output_root / session_id / file_name;
        }

        std::filesystem::path output_root;
        server::FilesystemChunkStore store;
        server::SessionTracker tracker;
        server::AssemblyEngine engine;
        server::LoggingArtifactSink sink;
        server::UploadCoordinator coordinator;
        server::RequestRouter router;
    };

    /**
     * Routes calls straight into a RequestRouter on the calling thread.
     *
     * A fault hook sees every request before the router does. It may rewrite the
     * payload, answer in the server's place, or stall the call forever.
     */
    class LoopbackTransport final : public UploadTransport
    {
    public:
        enum class Action
        {
            Forward,
            Respond,
            Stall
        };

        struct Decision
        {
            Action action{Action::Forward};
            protocol::ResponseEnvelope response{};
        };

        using FaultHook = std::function<Decision(protocol::Command, nlohmann::json &)>;

        explicit LoopbackTransport(server::RequestRouter &router) : router_(router) {}

        void set_fault(FaultHook hook)
        {
            std::lock_guard lock(mutex_);
            fault_ = std::move(hook);
        }

        std::future<protocol::ResponseEnvelope> call(protocol::Command command, nlohmann::json payload,
                                                     std::chrono::milliseconds /*timeout*/) override
        {
            FaultHook hook;
            {
                std::lock_guard lock(mutex_);
                ++calls_[command];
                hook = fault_;
            }

            auto promise = std::make_shared<std::promise<protocol::ResponseEnvelope>>();
            auto future = promise->get_future();
            Decision decision;
            if (hook)
            {
                decision = hook(command, payload);
            }
            switch (decision.action)
            {
            case Action::Stall:
            {
                std::lock_guard lock(mutex_);
                stalled_.push_back(promise);
                break;
            }
            case Action::Respond:
                promise->set_value(decision.response);
                break;
            case Action::Forward:
                promise->set_value(router_.handle(protocol::RequestEnvelope{
                    .command = command,
                    .payload = std::move(payload),
                    .request_id = std::nullopt,
                }));
                break;
            }
            return future;
        }

        std::size_t calls(protocol::Command command) const
        {
            std::lock_guard lock(mutex_);
            const auto it = calls_.find(command);
            return it == calls_.end() ? 0 : it->second;
        }

    private:
        server::RequestRouter &router_;
        mutable std::mutex mutex_;
        FaultHook fault_;
        std::map<protocol::Command, std::size_t> calls_;
        std::vector<std::shared_ptr<std::promise<protocol::ResponseEnvelope>>> stalled_;
    };

    LoopbackTransport::Decision respond_error(ErrorCode code, std::string message)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        return {.action = LoopbackTransport::Action::Respond, .response = std::move(envelope)};
    }

    DriverConfig fast_config(std::uint64_t chunk_size)
    {
        DriverConfig config;
        config.chunk_size = chunk_size;
        config.parallelism = 3;
        config.retry = RetryPolicy{
            .max_attempts = 4,
            .initial_backoff = std::chrono::milliseconds{1},
            .multiplier = 2.0,
            .max_backoff = std::chrono::milliseconds{10},
        };
        config.request_timeout = std::chrono::milliseconds{2000};
        return config;
    }

    std::shared_ptr<const ChunkSource> memory_source(const std::string &name, const std::vector<std::byte> &data)
    {
        return std::make_shared<MemoryChunkSource>(name, data);
    }

    std::uint64_t index_of(const nlohmann::json &payload)
    {
        return payload.at("index").get<std::uint64_t>();
    }

    void test_clean_upload_with_monotonic_progress()
    {
        TempDir dir("driver_clean");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);
        const auto data = make_payload(10 * 1000 + 17, 21);

        std::mutex progress_mutex;
        std::vector<std::uint64_t> reported;
        UploadDriver driver(transport, memory_source("clean.bin", data), fast_config(1000));
        driver.on_progress([&](std::uint64_t done, std::uint64_t total)
                           {
            assert(total == data.size());
            std::lock_guard lock(progress_mutex);
            reported.push_back(done); });

        const auto outcome = driver.start().get();
        assert(outcome.status == UploadStatus::Completed);
        assert(outcome.error == ErrorCode::Ok);
        assert(outcome.bytes_uploaded == data.size());
        assert(outcome.retries == 0);
        assert(read_file(server.artifact(outcome.session_id, "clean.bin")) == data);

        assert(!reported.empty());
        assert(std::is_sorted(reported.begin(), reported.end()));
        assert(std::adjacent_find(reported.begin(), reported.end()) == reported.end());
        assert(reported.back() == data.size());

        const auto status = driver.status();
        assert(status.session_id == outcome.session_id);
        assert(std::all_of(status.chunks.begin(), status.chunks.end(), [](ChunkState state)
                           { return state == ChunkState::Done; }));
        assert(transport.calls(protocol::Command::AbortSession) == 0);

        bool threw = false;
        try
        {
            (void)driver.start();
        }
        catch (const std::logic_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_transient_failures_are_retried()
    {
        TempDir dir("driver_retry");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);
        const auto data = make_payload(4500, 22);

        std::atomic<int> failures_left{2};
        transport.set_fault([&](protocol::Command command, nlohmann::json &payload)
                            {
            if (command == protocol::Command::UploadChunk && index_of(payload) == 1 && failures_left.fetch_sub(1) > 0)
            {
                return respond_error(ErrorCode::Busy, "try later");
            }
            return LoopbackTransport::Decision{}; });

        UploadDriver driver(transport, memory_source("retry.bin", data), fast_config(1000));
        const auto outcome = driver.start().get();
        assert(outcome.status == UploadStatus::Completed);
        assert(outcome.retries == 2);
        assert(read_file(server.artifact(outcome.session_id, "retry.bin")) == data);
    }

    void test_permanent_failure_aborts_session()
    {
        TempDir dir("driver_permanent");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);
        const auto data = make_payload(3000, 23);

        transport.set_fault([&](protocol::Command command, nlohmann::json &payload)
                            {
            if (command == protocol::Command::UploadChunk && index_of(payload) == 2)
            {
                return respond_error(ErrorCode::UploadRejected, "quota exceeded");
            }
            return LoopbackTransport::Decision{}; });

        auto config = fast_config(1000);
        config.parallelism = 1;
        UploadDriver driver(transport, memory_source("perm.bin", data), config);
        const auto outcome = driver.start(std::string("perm")).get();
        assert(outcome.status == UploadStatus::Failed);
        assert(outcome.error == ErrorCode::UploadRejected);
        assert(outcome.session_id == "perm");
        assert(outcome.retries == 0);
        assert(transport.calls(protocol::Command::AbortSession) == 1);
        assert(!server.tracker.contains("perm"));
        assert(server.store.sessions().empty());
        assert(driver.status().chunks.at(2) == ChunkState::Failed);
    }

    void test_rejected_begin_fails_without_abort()
    {
        TempDir dir("driver_rejected");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);
        const auto data = make_payload(100, 24);

        UploadDriver driver(transport, memory_source("../escape.bin", data), fast_config(10));
        const auto outcome = driver.start().get();
        assert(outcome.status == UploadStatus::Failed);
        assert(outcome.error == ErrorCode::InvalidPayload);
        assert(outcome.session_id.empty());
        assert(transport.calls(protocol::Command::UploadChunk) == 0);
        assert(transport.calls(protocol::Command::AbortSession) == 0);
    }

    void test_exhausted_retries_leave_session_resumable()
    {
        TempDir dir("driver_resume");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);
        const auto data = make_payload(5000, 25);

        transport.set_fault([&](protocol::Command command, nlohmann::json &payload)
                            {
            if (command == protocol::Command::UploadChunk && index_of(payload) == 4)
            {
                return respond_error(ErrorCode::Timeout, "link down");
            }
            return LoopbackTransport::Decision{}; });

        {
            auto config = fast_config(1000);
            config.parallelism = 1;
            UploadDriver driver(transport, memory_source("resume.bin", data), config);
            const auto outcome = driver.start(std::string("resumable")).get();
            assert(outcome.status == UploadStatus::Failed);
            assert(outcome.error == ErrorCode::Timeout);
            assert(outcome.failure == FailureClass::RetryAutomatically);
            assert(outcome.retries == config.retry.max_attempts - 1);
            assert(transport.calls(protocol::Command::AbortSession) == 0);
        }
        assert((server.coordinator.query_missing_chunks("resumable") == std::set<std::uint64_t>{4}));

        transport.set_fault(nullptr);
        const auto uploads_before = transport.calls(protocol::Command::UploadChunk);
        std::vector<std::uint64_t> reported;
        UploadDriver driver(transport, memory_source("resume.bin", data), fast_config(1000));
        driver.on_progress([&](std::uint64_t done, std::uint64_t)
                           { reported.push_back(done); });
        const auto outcome = driver.start(std::string("resumable")).get();
        assert(outcome.status == UploadStatus::Completed);
        assert(transport.calls(protocol::Command::UploadChunk) == uploads_before + 1);
        assert(reported.front() == 4000);
        assert(reported.back() == 5000);
        assert(read_file(server.artifact("resumable", "resume.bin")) == data);
    }

    void test_cancel_aborts_session()
    {
        TempDir dir("driver_cancel");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);
        const auto data = make_payload(6000, 26);

        transport.set_fault([&](protocol::Command command, nlohmann::json &payload)
                            {
            if (command == protocol::Command::UploadChunk && index_of(payload) >= 2)
            {
                return LoopbackTransport::Decision{.action = LoopbackTransport::Action::Stall};
            }
            return LoopbackTransport::Decision{}; });

        auto config = fast_config(1000);
        config.parallelism = 2;
        UploadDriver driver(transport, memory_source("cancel.bin", data), config);
        auto future = driver.start(std::string("cancelme"));

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
        while (transport.calls(protocol::Command::UploadChunk) < 3 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
        }
        driver.cancel();

        const auto outcome = future.get();
        assert(outcome.status == UploadStatus::Cancelled);
        assert(outcome.failure == FailureClass::None);
        assert(driver.status().cancelled);
        assert(transport.calls(protocol::Command::AbortSession) == 1);
        assert(!server.tracker.contains("cancelme"));
        assert(!std::filesystem::exists(server.artifact("cancelme", "cancel.bin")));
    }

    void test_cancel_during_begin_aborts_requested_session()
    {
        TempDir dir("driver_cancel_begin");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);
        const auto data = make_payload(3000, 36);

        // The server creates the session but its answer never arrives.
        transport.set_fault([&](protocol::Command command, nlohmann::json &payload)
                            {
            if (command == protocol::Command::BeginSession)
            {
                (void)server.router.handle(protocol::RequestEnvelope{
                    .command = command,
                    .payload = payload,
                    .request_id = std::nullopt,
                });
                return LoopbackTransport::Decision{.action = LoopbackTransport::Action::Stall};
            }
            return LoopbackTransport::Decision{}; });

        UploadDriver driver(transport, memory_source("early.bin", data), fast_config(1000));
        auto future = driver.start(std::string("early"));
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
        while (!server.tracker.contains("early") && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
        }
        assert(server.tracker.contains("early"));
        driver.cancel();

        const auto outcome = future.get();
        assert(outcome.status == UploadStatus::Cancelled);
        assert(outcome.session_id == "early");
        assert(transport.calls(protocol::Command::AbortSession) == 1);
        assert(transport.calls(protocol::Command::UploadChunk) == 0);
        assert(!server.tracker.contains("early"));
    }

    void test_unframeable_chunk_aborts_session()
    {
        TempDir dir("driver_unframeable");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);
        const auto data = make_payload(3000, 37);

        transport.set_fault([&](protocol::Command command, nlohmann::json &payload) -> LoopbackTransport::Decision
                            {
            if (command == protocol::Command::UploadChunk && index_of(payload) == 1)
            {
                throw TransportError(ErrorCode::InvalidChunk, "JSON message too large to frame");
            }
            return LoopbackTransport::Decision{}; });

        auto config = fast_config(1000);
        config.parallelism = 1;
        UploadDriver driver(transport, memory_source("huge.bin", data), config);
        const auto outcome = driver.start(std::string("huge")).get();
        assert(outcome.status == UploadStatus::Failed);
        assert(outcome.error == ErrorCode::InvalidChunk);
        assert(outcome.retries == 0);
        assert(transport.calls(protocol::Command::AbortSession) == 1);
        assert(!server.tracker.contains("huge"));
    }

    void test_pause_holds_chunk_uploads()
    {
        TempDir dir("driver_pause");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);
        const auto data = make_payload(3000, 27);

        UploadDriver driver(transport, memory_source("pause.bin", data), fast_config(1000));
        driver.pause();
        auto future = driver.start();
        assert(future.wait_for(std::chrono::milliseconds{200}) == std::future_status::timeout);
        assert(transport.calls(protocol::Command::UploadChunk) == 0);
        const auto paused = driver.status();
        assert(paused.paused);
        assert(paused.bytes_completed == 0);

        driver.resume();
        const auto outcome = future.get();
        assert(outcome.status == UploadStatus::Completed);
        assert(!driver.status().paused);
    }

    void test_finalize_reuploads_missing_chunks()
    {
        TempDir dir("driver_missing");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);
        const auto data = make_payload(3000, 28);

        // Acknowledge chunk 1 once without storing it.
        std::atomic<bool> dropped{false};
        transport.set_fault([&](protocol::Command command, nlohmann::json &payload)
                            {
            if (command == protocol::Command::UploadChunk && index_of(payload) == 1 && !dropped.exchange(true))
            {
                LoopbackTransport::Decision decision{.action = LoopbackTransport::Action::Respond};
                decision.response.payload = protocol::ChunkAck{
                    .session_id = payload.at("session_id").get<std::string>(),
                    .index = 1,
                    .complete = false,
                    .assembled = false,
                    .received_chunks = 0,
                    .total_chunks = 3,
                };
                return decision;
            }
            return LoopbackTransport::Decision{}; });

        UploadDriver driver(transport, memory_source("missing.bin", data), fast_config(1000));
        const auto outcome = driver.start().get();
        assert(outcome.status == UploadStatus::Completed);
        assert(transport.calls(protocol::Command::FinalizeSession) == 1);
        assert(transport.calls(protocol::Command::UploadChunk) == 4);
        assert(read_file(server.artifact(outcome.session_id, "missing.bin")) == data);
    }

    void test_failed_assembly_resends_every_chunk()
    {
        TempDir dir("driver_assembly");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);
        const auto data = make_payload(3000, 29);

        // Corrupt the first copy of chunk 0 in transit, past the per-chunk hash.
        std::atomic<bool> corrupted{false};
        transport.set_fault([&](protocol::Command command, nlohmann::json &payload)
                            {
            if (command == protocol::Command::UploadChunk && index_of(payload) == 0 && !corrupted.exchange(true))
            {
                payload["data"] = encoding::encode_base64(make_payload(1000, 99));
                payload.erase("hash");
            }
            return LoopbackTransport::Decision{}; });

        auto config = fast_config(1000);
        config.parallelism = 1;
        UploadDriver driver(transport, memory_source("assembly.bin", data), config);
        const auto outcome = driver.start().get();
        assert(outcome.status == UploadStatus::Completed);
        assert(transport.calls(protocol::Command::UploadChunk) == 6);
        assert(transport.calls(protocol::Command::FinalizeSession) == 1);
        assert(read_file(server.artifact(outcome.session_id, "assembly.bin")) == data);
    }

    void test_persistent_assembly_failure_gives_up()
    {
        TempDir dir("driver_assembly_fail");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);
        const auto data = make_payload(2000, 30);

        transport.set_fault([&](protocol::Command command, nlohmann::json &payload)
                            {
            if (command == protocol::Command::BeginSession)
            {
                payload["checksum"] = std::string(64, 'f');
            }
            return LoopbackTransport::Decision{}; });

        UploadDriver driver(transport, memory_source("never.bin", data), fast_config(1000));
        const auto outcome = driver.start(std::string("never")).get();
        assert(outcome.status == UploadStatus::Failed);
        assert(outcome.error == ErrorCode::AssemblyFailed);
        assert(transport.calls(protocol::Command::AbortSession) == 0);
        assert(server.coordinator.session_status("never").phase == "assembly_failed");
    }

    void test_zero_byte_upload()
    {
        TempDir dir("driver_empty");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);

        UploadDriver driver(transport, memory_source("empty.txt", {}), fast_config(1000));
        const auto outcome = driver.start().get();
        assert(outcome.status == UploadStatus::Completed);
        assert(transport.calls(protocol::Command::UploadChunk) == 0);
        assert(std::filesystem::file_size(server.artifact(outcome.session_id, "empty.txt")) == 0);
    }

    void test_driver_rejects_bad_construction()
    {
        TempDir dir("driver_ctor");
        ServerStack server(dir.path());
        LoopbackTransport transport(server.router);

        bool threw = false;
        try
        {
            UploadDriver driver(transport, nullptr, DriverConfig{});
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            UploadDriver driver(transport, memory_source("a", make_payload(1, 1)), DriverConfig{.chunk_size = 0});
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_worker_pool()
    {
        CancellationToken token;
        {
            WorkerPool pool(4, token);
            assert(pool.size() == 4);
            std::atomic<int> counter{0};
            for (int i = 0; i < 100; ++i)
            {
                pool.submit([&]
                            { ++counter; });
            }
            pool.wait_idle();
            assert(counter.load() == 100);

            pool.submit([]
                        { throw std::runtime_error("task failed"); });
            bool rethrown = false;
            try
            {
                pool.wait_idle();
            }
            catch (const std::runtime_error &ex)
            {
                rethrown = std::string(ex.what()) == "task failed";
            }
            assert(rethrown);
        }

        CancellationToken cancelled;
        WorkerPool pool(1, cancelled);
        std::promise<void> started;
        std::promise<void> gate;
        auto gate_future = gate.get_future().share();
        std::atomic<int> ran{0};
        pool.submit([&]
                    {
            started.set_value();
            gate_future.wait();
            ++ran; });
        for (int i = 0; i < 10; ++i)
        {
            pool.submit([&]
                        { ++ran; });
        }
        started.get_future().wait();
        cancelled.cancel();
        gate.set_value();
        pool.wait_idle();
        assert(ran.load() == 1);
    }

    void test_cancellation_token()
    {
        CancellationToken token;
        const auto copy = token;
        assert(!copy.is_cancelled());
        assert(!token.wait_for(std::chrono::milliseconds{1}));

        std::thread canceller([&]
                              {
            std::this_thread::sleep_for(std::chrono::milliseconds{20});
            token.cancel(); });
        const auto started = std::chrono::steady_clock::now();
        assert(copy.wait_for(std::chrono::seconds{10}));
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds{5});
        canceller.join();
        assert(copy.is_cancelled());
    }

    void test_retry_policy_backoff()
    {
        const RetryPolicy policy{};
        assert(policy.backoff_for(1) == std::chrono::milliseconds{200});
        assert(policy.backoff_for(2) == std::chrono::milliseconds{400});
        assert(policy.backoff_for(4) == std::chrono::milliseconds{1600});
        assert(policy.backoff_for(20) == std::chrono::seconds{10});
    }

    void test_transfer_state_store()
    {
        TempDir dir("state_store");
        const auto state_path = dir.path() / "nested" / "sessions.json";
        {
            TransferStateStore store(state_path);
            assert(store.entries().empty());
            store.upsert(TransferStateStore::Entry{
                .endpoint = "localhost:9000",
                .local_path = "/tmp/video.mp4",
                .total_size = 2500000,
                .chunk_size = 1000000,
                .session_id = "abc",
            });
            store.upsert(TransferStateStore::Entry{
                .endpoint = "localhost:9000",
                .local_path = "/tmp/video.mp4",
                .total_size = 2500000,
                .chunk_size = 1000000,
                .session_id = "def",
            });
            assert(store.entries().size() == 1);
        }

        TransferStateStore reloaded(state_path);
        const auto found = reloaded.find("localhost:9000", "/tmp/video.mp4", 2500000, 1000000);
        assert(found && found->session_id == "def");
        assert(!reloaded.find("localhost:9000", "/tmp/video.mp4", 2500001, 1000000));
        assert(!reloaded.find("localhost:9001", "/tmp/video.mp4", 2500000, 1000000));

        reloaded.remove("localhost:9000", "/tmp/video.mp4");
        TransferStateStore emptied(state_path);
        assert(emptied.entries().empty());

        {
            std::ofstream corrupt(state_path, std::ios::trunc);
            corrupt << "{ not json";
        }
        TransferStateStore recovered(state_path);
        assert(recovered.entries().empty());
    }

    void test_file_chunk_source()
    {
        TempDir dir("file_source");
        const auto path = dir.path() / "source.bin";
        const auto data = make_payload(2048, 31);
        {
            std::ofstream out(path, std::ios::binary);
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        }
        FileChunkSource source(path);
        assert(source.file_name() == "source.bin");
        assert(source.size() == 2048);
        assert(source.read(1000, 48) == chunkwise::test::slice(data, 1000, 48));

        bool threw = false;
        try
        {
            (void)source.read(2040, 16);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_parse_client_arguments()
    {
        const char *argv[] = {"chunkwise-upload", "example.org:7000", "big.iso", "--chunk-size", "4096",
                              "--parallel", "8", "--retries", "7", "--session-id", "resume-me", "--no-checksum"};
        auto config = parse_arguments(static_cast<int>(std::size(argv)), const_cast<char **>(argv));
        assert(config.host == "example.org");
        assert(config.port == 7000);
        assert(config.endpoint() == "example.org:7000");
        assert(config.file == "big.iso");
        assert(config.driver.chunk_size == 4096);
        assert(config.driver.parallelism == 8);
        assert(config.driver.retry.max_attempts == 7);
        assert(config.session_id == std::optional<std::string>("resume-me"));
        assert(!config.driver.send_chunk_hashes && !config.driver.send_file_checksum);

        const char *bad[] = {"chunkwise-upload", "no-port", "file"};
        bool threw = false;
        try
        {
            (void)parse_arguments(3, const_cast<char **>(bad));
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);

        const auto oversized = std::to_string(protocol::kMaxChunkBytes + 1);
        const char *too_big[] = {"chunkwise-upload", "example.org:7000", "big.iso", "--chunk-size", oversized.c_str()};
        threw = false;
        try
        {
            (void)parse_arguments(static_cast<int>(std::size(too_big)), const_cast<char **>(too_big));
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

} // namespace

void run_client_driver_tests()
{
    test_clean_upload_with_monotonic_progress();
    test_transient_failures_are_retried();
    test_permanent_failure_aborts_session();
    test_rejected_begin_fails_without_abort();
    test_exhausted_retries_leave_session_resumable();
    test_cancel_aborts_session();
    test_cancel_during_begin_aborts_requested_session();
    test_unframeable_chunk_aborts_session();
    test_pause_holds_chunk_uploads();
    test_finalize_reuploads_missing_chunks();
    test_failed_assembly_resends_every_chunk();
    test_persistent_assembly_failure_gives_up();
    test_zero_byte_upload();
    test_driver_rejects_bad_construction();
    test_worker_pool();
    test_cancellation_token();
    test_retry_policy_backoff();
    test_transfer_state_store();
    test_file_chunk_source();
    test_parse_client_arguments();
    std::cout << "Client driver tests passed\n";
}
