#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

#include "chunkwise/client/chunk_source.hpp"
#include "chunkwise/client/config.hpp"
#include "chunkwise/client/logger.hpp"
#include "chunkwise/client/tcp_transport.hpp"
#include "chunkwise/client/transfer_state_store.hpp"
#include "chunkwise/client/upload_driver.hpp"
#include "chunkwise/version.hpp"

namespace
{

    std::atomic<bool> g_interrupted{false};

    void handle_interrupt(int /*signal*/)
    {
        g_interrupted = true;
    }

    void remember_session(chunkwise::client::TransferStateStore &store, const chunkwise::client::ClientConfig &config,
                          std::uint64_t total_size, const std::string &session_id)
    {
        try
        {
            store.upsert({
                .endpoint = config.endpoint(),
                .local_path = config.file,
                .total_size = total_size,
                .chunk_size = config.driver.chunk_size,
                .session_id = session_id,
            });
        }
        catch (const std::exception &ex)
        {
            std::cerr << "\nWARNING: cannot record session for resume: " << ex.what() << std::endl;
        }
    }

    void forget_session(chunkwise::client::TransferStateStore &store, const chunkwise::client::ClientConfig &config)
    {
        try
        {
            store.remove(config.endpoint(), config.file);
        }
        catch (const std::exception &ex)
        {
            std::cerr << "WARNING: cannot update " << store.state_path().string() << ": " << ex.what() << std::endl;
        }
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace chunkwise::client;

    try
    {
        const auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path);
        logger.log("client", "Chunkwise upload client ", chunkwise::version());

        auto source = std::make_shared<FileChunkSource>(config.file);
        TransferStateStore store;

        auto session_id = config.session_id;
        if (!session_id && !config.fresh)
        {
            if (auto entry = store.find(config.endpoint(), config.file, source->size(), config.driver.chunk_size))
            {
                session_id = entry->session_id;
                std::cout << "Resuming session " << *session_id << std::endl;
            }
        }

        TcpTransport transport(config.host, config.port);
        UploadDriver driver(transport, source, config.driver, logger);
        driver.on_progress([](std::uint64_t completed, std::uint64_t total)
                           { std::cout << "\rUploaded " << completed << " / " << total << " bytes" << std::flush; });

        std::signal(SIGINT, handle_interrupt);
        auto future = driver.start(session_id);

        bool recorded = false;
        bool cancel_requested = false;
        while (future.wait_for(std::chrono::milliseconds{100}) != std::future_status::ready)
        {
            if (g_interrupted && !cancel_requested)
            {
                std::cout << "\nCancelling..." << std::endl;
                driver.cancel();
                cancel_requested = true;
            }
            if (!recorded)
            {
                const auto status = driver.status();
                if (!status.session_id.empty())
                {
                    remember_session(store, config, source->size(), status.session_id);
                    recorded = true;
                }
            }
        }

        const auto outcome = future.get();
        std::cout << std::endl;
        switch (outcome.status)
        {
        case UploadStatus::Completed:
            forget_session(store, config);
            std::cout << "Upload complete (session " << outcome.session_id << ", " << outcome.retries << " retries)"
                      << std::endl;
            return EXIT_SUCCESS;
        case UploadStatus::Cancelled:
            forget_session(store, config);
            std::cout << "Upload cancelled" << std::endl;
            return EXIT_FAILURE;
        case UploadStatus::Failed:
            break;
        }

        std::cerr << "ERROR: " << chunkwise::to_string(outcome.error) << ": " << outcome.message << std::endl;
        switch (outcome.failure)
        {
        case chunkwise::FailureClass::RetryAutomatically:
            if (!outcome.session_id.empty())
            {
                remember_session(store, config, source->size(), outcome.session_id);
            }
            std::cerr << "Run the same command again to resume the upload." << std::endl;
            break;
        case chunkwise::FailureClass::RestartUpload:
            forget_session(store, config);
            std::cerr << "The upload has to start over; run the command again." << std::endl;
            break;
        case chunkwise::FailureClass::ContactSupport:
        case chunkwise::FailureClass::None:
            forget_session(store, config);
            std::cerr << "The server rejected this upload." << std::endl;
            break;
        }
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
