#include "chunkwise/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <vector>

namespace chunkwise::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        std::vector<spdlog::sink_ptr> sinks;
        if (path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false));
        }
        else
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        logger_ = std::make_shared<spdlog::logger>("upload", sinks.begin(), sinks.end());
        logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
        logger_->set_level(path ? spdlog::level::info : spdlog::level::off);
        logger_->flush_on(spdlog::level::warn);
    }

} // namespace chunkwise::client
