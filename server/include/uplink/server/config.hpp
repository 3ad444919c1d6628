#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace uplink::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8080};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        // Sessions without activity for this long are purged with their chunks.
        std::chrono::seconds session_timeout{std::chrono::seconds{3600}};
        // Files larger than this are refused outright; 0 disables the check.
        std::uint64_t max_file_size{0};
        std::optional<std::filesystem::path> log_file;
    };

} // namespace uplink::server
