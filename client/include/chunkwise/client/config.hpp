#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "chunkwise/client/upload_driver.hpp"

namespace chunkwise::client
{

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        std::filesystem::path file;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::string> session_id;
        /// Ignore any remembered session and start a new one.
        bool fresh{false};
        DriverConfig driver{};

        std::string endpoint() const { return host + ":" + std::to_string(port); }
    };

    /// Throws std::runtime_error with a usage message on bad input.
    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace chunkwise::client
