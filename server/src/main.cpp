#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "uplink/server/server.hpp"
#include "uplink/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "Uplink server " << uplink::version() << "\n"
                  << "Usage: " << program_name
                  << " --root <ROOT> [--port <PORT>] [--address <ADDRESS>] [--threads <N>]"
                     " [--session-timeout <seconds>] [--max-file-size <bytes>] [--log <FILE>] [--verbose]\n";
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

    enum class ParseResult
    {
        Run,
        Help,
        Error
    };

    ParseResult parse_arguments(int argc, char *argv[], uplink::server::ServerConfig &config, bool &verbose)
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                return ParseResult::Help;
            }
            if (arg == "--verbose" || arg == "-v")
            {
                verbose = true;
                continue;
            }

            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                return ParseResult::Error;
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
            else if (arg == "--max-file-size")
            {
                config.max_file_size = std::stoull(*value);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                return ParseResult::Error;
            }
        }
        if (config.root.empty())
        {
            std::cerr << "--root is required" << std::endl;
            return ParseResult::Error;
        }
        return ParseResult::Run;
    }

} // namespace

int main(int argc, char *argv[])
{
    using uplink::server::Server;
    using uplink::server::ServerConfig;

    ServerConfig config;
    bool verbose = false;

    ParseResult parsed = ParseResult::Error;
    try
    {
        parsed = parse_arguments(argc, argv, config, verbose);
    }
    catch (const std::logic_error &ex)
    {
        std::cerr << "Invalid numeric argument: " << ex.what() << std::endl;
    }
    if (parsed != ParseResult::Run)
    {
        print_usage(argv[0]);
        return parsed == ParseResult::Help ? EXIT_SUCCESS : EXIT_FAILURE;
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
        spdlog::info("Starting Uplink server {} on {}:{}", uplink::version(), config.address, config.port);

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
