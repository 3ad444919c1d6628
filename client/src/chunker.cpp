#include "uplink/client/chunker.hpp"

#include <algorithm>

#include "uplink/crypto.hpp"
#include "uplink/file_io.hpp"

namespace uplink::client::chunking
{

    SourceReadError::SourceReadError(const std::filesystem::path &path, const std::string &message)
        : std::runtime_error("Cannot read " + path.string() + ": " + message), path_(path) {}

    std::vector<ChunkDescriptor> plan(std::uint64_t total_size, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be greater than zero");
        }
        std::vector<ChunkDescriptor> chunks;
        chunks.reserve(static_cast<std::size_t>((total_size + chunk_size - 1) / chunk_size));
        std::uint64_t offset = 0;
        std::uint64_t index = 0;
        while (offset < total_size)
        {
            const auto length = std::min(chunk_size, total_size - offset);
            chunks.push_back(ChunkDescriptor{.index = index++, .offset = offset, .length = length});
            offset += length;
        }
        return chunks;
    }

    std::vector<std::byte> read_chunk(const std::filesystem::path &path, const ChunkDescriptor &chunk)
    {
        try
        {
            return uplink::file_io::read_range(path, chunk.offset, chunk.length);
        }
        catch (const std::runtime_error &ex)
        {
            throw SourceReadError(path, ex.what());
        }
    }

    std::string checksum(std::span<const std::byte> data)
    {
        return uplink::crypto::hash_bytes(data);
    }

} // namespace uplink::client::chunking
