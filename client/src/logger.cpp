#include "uplink/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace uplink::client
{

    Logger::Logger()
        : logger_(std::make_shared<spdlog::logger>("uplink-client", std::make_shared<spdlog::sinks::null_sink_mt>()))
    {
    }

    Logger::Logger(const std::optional<std::filesystem::path> &path, bool verbose)
    {
        std::vector<spdlog::sink_ptr> sinks;
        if (path)
        {
            // Throws spdlog::spdlog_ex when the file cannot be opened.
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false));
        }
        if (verbose)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        logger_ = std::make_shared<spdlog::logger>("uplink-client", sinks.begin(), sinks.end());
        logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
        logger_->set_level(spdlog::level::info);
        logger_->flush_on(spdlog::level::warn);
    }

} // namespace uplink::client
