#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace uplink::client
{

    struct TransferConfig
    {
        // Bytes per chunk; the last chunk of a file carries the remainder.
        std::uint64_t chunk_size{5ull * 1024 * 1024};
        // Number of workers, and so the most tasks UPLOADING at once.
        std::size_t concurrency{2};
        // First backoff delay; doubles per attempt up to retry_max_delay.
        std::chrono::milliseconds retry_base_delay{500};
        std::chrono::milliseconds retry_max_delay{30000};
        // Transient failures tolerated before a task is marked FAILED.
        std::uint32_t max_attempts{8};
        std::chrono::milliseconds probe_interval{10000};
        std::chrono::milliseconds probe_timeout{2000};
        // Bound on each open, send, finalize and status query.
        std::chrono::milliseconds operation_timeout{30000};
        // How long stop() lets workers reach a chunk boundary before cutting sockets.
        std::chrono::milliseconds shutdown_grace{5000};
    };

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        std::filesystem::path state_dir{".uplink-client"};
        std::optional<std::filesystem::path> log_path;
        bool verbose{false};
        TransferConfig transfer;
    };

    /// Throws std::runtime_error carrying a usage message on malformed input.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage();

} // namespace uplink::client
