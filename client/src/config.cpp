#include "uplink/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

#include "uplink/protocol.hpp"

namespace uplink::client
{

    namespace
    {

        std::uint64_t parse_number(const std::string &flag, const std::string &value)
        {
            std::size_t consumed = 0;
            std::uint64_t parsed = 0;
            try
            {
                parsed = std::stoull(value, &consumed);
            }
            catch (const std::logic_error &)
            {
                consumed = 0;
            }
            if (consumed == 0 || consumed != value.size() || value.front() == '-')
            {
                throw std::runtime_error(flag + " expects a non-negative integer, got '" + value + "'\n" + usage());
            }
            return parsed;
        }

        std::uint64_t parse_positive(const std::string &flag, const std::string &value)
        {
            const auto parsed = parse_number(flag, value);
            if (parsed == 0)
            {
                throw std::runtime_error(flag + " must be greater than zero\n" + usage());
            }
            return parsed;
        }

    } // namespace

    std::string usage()
    {
        return "Usage: uplink_client <host>:<port> [--state-dir <dir>] [--chunk-size <bytes>] [--workers <n>]\n"
               "       [--retry-base-ms <ms>] [--retry-max-ms <ms>] [--max-attempts <n>]\n"
               "       [--probe-interval-ms <ms>] [--probe-timeout-ms <ms>] [--timeout-ms <ms>]\n"
               "       [--grace-ms <ms>] [--log <file>] [--verbose]";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(usage());
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port\n" + usage());
        }
        config.host = endpoint.substr(0, colon_pos);
        const auto port = parse_positive("port", endpoint.substr(colon_pos + 1));
        if (port > 65535)
        {
            throw std::runtime_error("Port out of range\n" + usage());
        }
        config.port = static_cast<std::uint16_t>(port);

        auto &transfer = config.transfer;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--verbose")
            {
                config.verbose = true;
                continue;
            }
            if (index >= argc)
            {
                throw std::runtime_error(arg + " requires a value\n" + usage());
            }
            const std::string value = argv[index++];
            if (arg == "--state-dir")
            {
                config.state_dir = std::filesystem::path(value);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(value);
            }
            else if (arg == "--chunk-size")
            {
                transfer.chunk_size = parse_positive(arg, value);
                if (transfer.chunk_size > uplink::protocol::kMaxChunkSize)
                {
                    throw std::runtime_error("--chunk-size may not exceed " +
                                             std::to_string(uplink::protocol::kMaxChunkSize) + " bytes");
                }
            }
            else if (arg == "--workers")
            {
                transfer.concurrency = static_cast<std::size_t>(parse_positive(arg, value));
            }
            else if (arg == "--retry-base-ms")
            {
                transfer.retry_base_delay = std::chrono::milliseconds(parse_positive(arg, value));
            }
            else if (arg == "--retry-max-ms")
            {
                transfer.retry_max_delay = std::chrono::milliseconds(parse_positive(arg, value));
            }
            else if (arg == "--max-attempts")
            {
                transfer.max_attempts = static_cast<std::uint32_t>(parse_positive(arg, value));
            }
            else if (arg == "--probe-interval-ms")
            {
                transfer.probe_interval = std::chrono::milliseconds(parse_positive(arg, value));
            }
            else if (arg == "--probe-timeout-ms")
            {
                transfer.probe_timeout = std::chrono::milliseconds(parse_positive(arg, value));
            }
            else if (arg == "--timeout-ms")
            {
                transfer.operation_timeout = std::chrono::milliseconds(parse_positive(arg, value));
            }
            else if (arg == "--grace-ms")
            {
                transfer.shutdown_grace = std::chrono::milliseconds(parse_number(arg, value));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg + "\n" + usage());
            }
        }

        if (transfer.retry_max_delay < transfer.retry_base_delay)
        {
            throw std::runtime_error("--retry-max-ms must not be below --retry-base-ms");
        }
        return config;
    }

} // namespace uplink::client
