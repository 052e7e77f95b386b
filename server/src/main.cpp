#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "chunkwise/crypto.hpp"
#include "chunkwise/server/server.hpp"
#include "chunkwise/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    constexpr std::uint64_t kMebibyte = 1024ULL * 1024ULL;

    void print_usage(const char *program_name)
    {
        std::cout << "Chunkwise upload server " << chunkwise::version() << "\n"
                  << "Usage: " << program_name << " --port <PORT> --root <ROOT> [options]\n"
                  << "  --address <ADDRESS>         listen address (default 0.0.0.0)\n"
                  << "  --threads <N>               worker threads (default: hardware concurrency)\n"
                  << "  --session-timeout <SEC>     reap sessions idle for longer (default 3600)\n"
                  << "  --reap-interval <SEC>       reaper period (default 60)\n"
                  << "  --max-file-size <MB>        largest accepted file, 0 for no limit (default 1024)\n"
                  << "  --max-chunk-size <MB>       largest accepted chunk, at most 35 (default 32)\n"
                  << "  --allowed-types <a,b,...>   accepted file extensions (default: all)\n"
                  << "  --no-verify-checksums       skip whole-file checksum verification\n"
                  << "  --flat-output               write artifacts directly into ROOT\n"
                  << "  --memory-sessions           keep session state in memory only\n"
                  << "  --log <FILE>                also log to FILE\n"
                  << "  --verbose                   debug logging\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::vector<std::string> parse_extensions(const std::string &value)
    {
        std::vector<std::string> extensions;
        std::stringstream stream(value);
        std::string item;
        while (std::getline(stream, item, ','))
        {
            if (!item.empty() && item.front() == '.')
            {
                item.erase(0, 1);
            }
            std::transform(item.begin(), item.end(), item.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            if (!item.empty())
            {
                extensions.push_back(item);
            }
        }
        return extensions;
    }

} // namespace

int main(int argc, char *argv[])
{
    using chunkwise::server::Server;
    using chunkwise::server::ServerConfig;

    ServerConfig config;
    bool verbose = false;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            if (arg == "--no-verify-checksums")
            {
                config.verify_checksums = false;
                continue;
            }
            if (arg == "--flat-output")
            {
                config.per_session_directory = false;
                continue;
            }
            if (arg == "--memory-sessions")
            {
                config.persist_sessions = false;
                continue;
            }
            if (arg == "--verbose")
            {
                verbose = true;
                continue;
            }

            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--session-timeout")
            {
                config.session_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--reap-interval")
            {
                config.reap_interval = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--max-file-size")
            {
                config.limits.max_file_size = std::stoull(*value) * kMebibyte;
            }
            else if (arg == "--max-chunk-size")
            {
                config.limits.max_chunk_size = std::stoull(*value) * kMebibyte;
            }
            else if (arg == "--allowed-types")
            {
                config.limits.allowed_extensions = parse_extensions(*value);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
    }
    catch (const std::logic_error &ex)
    {
        std::cerr << "Invalid numeric argument: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (config.port == 0 || config.root.empty() || config.reap_interval.count() <= 0)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting Chunkwise server {} on {}:{}", chunkwise::version(), config.address, config.port);

        chunkwise::crypto::ensure_sodium_init();
        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
