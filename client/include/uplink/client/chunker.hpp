#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "uplink/client/task.hpp"
#include "uplink/error_codes.hpp"

namespace uplink::client::chunking
{

    class SourceReadError : public std::runtime_error
    {
    public:
        SourceReadError(const std::filesystem::path &path, const std::string &message);

        uplink::ErrorCode code() const noexcept { return uplink::ErrorCode::SourceUnreadable; }
        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    /// Ordered descriptors covering [0, total_size) exactly once. A zero-byte file has no
    /// chunks. Throws std::invalid_argument when chunk_size is 0.
    std::vector<ChunkDescriptor> plan(std::uint64_t total_size, std::uint64_t chunk_size);

    /// Reads the chunk's bytes from disk on every call.
    std::vector<std::byte> read_chunk(const std::filesystem::path &path, const ChunkDescriptor &chunk);

    std::string checksum(std::span<const std::byte> data);

} // namespace uplink::client::chunking
