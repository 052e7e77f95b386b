#include "chunkwise/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

#include "chunkwise/framing.hpp"

namespace chunkwise::client
{

    namespace
    {
        constexpr auto kUsage =
            "Usage: chunkwise-upload <server>:<port> <file> [--chunk-size <bytes>] [--parallel <n>] "
            "[--retries <n>] [--backoff-ms <ms>] [--timeout-ms <ms>] [--session-id <id>] [--no-checksum] "
            "[--fresh] [--log <file>]";

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error(kUsage);
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        config.port = static_cast<std::uint16_t>(std::stoi(endpoint.substr(colon_pos + 1)));
        config.file = std::filesystem::path(argv[index++]);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--chunk-size")
            {
                config.driver.chunk_size = std::stoull(require_value(index, argc, argv, arg));
                if (config.driver.chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
                if (config.driver.chunk_size > protocol::kMaxChunkBytes)
                {
                    throw std::runtime_error("--chunk-size may not exceed " + std::to_string(protocol::kMaxChunkBytes) +
                                             " bytes");
                }
            }
            else if (arg == "--parallel")
            {
                config.driver.parallelism = static_cast<std::size_t>(std::stoul(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--retries")
            {
                config.driver.retry.max_attempts =
                    static_cast<std::size_t>(std::stoul(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--backoff-ms")
            {
                config.driver.retry.initial_backoff =
                    std::chrono::milliseconds(std::stoll(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--timeout-ms")
            {
                config.driver.request_timeout =
                    std::chrono::milliseconds(std::stoll(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--session-id")
            {
                config.session_id = require_value(index, argc, argv, arg);
            }
            else if (arg == "--no-checksum")
            {
                config.driver.send_chunk_hashes = false;
                config.driver.send_file_checksum = false;
            }
            else if (arg == "--fresh")
            {
                config.fresh = true;
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg + "\n" + kUsage);
            }
        }

        return config;
    }

} // namespace chunkwise::client
