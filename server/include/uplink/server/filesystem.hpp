#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "uplink/error_codes.hpp"
#include "uplink/protocol.hpp"

namespace uplink::server
{

    class FilesystemError : public std::runtime_error
    {
    public:
        FilesystemError(uplink::ErrorCode code, std::string message);

        uplink::ErrorCode code() const noexcept { return code_; }

    private:
        uplink::ErrorCode code_;
    };

    /// Layout of the collector root: published files live under `completed/`, each
    /// with a `.metadata.json` sidecar describing the upload.
    class Filesystem
    {
    public:
        explicit Filesystem(std::filesystem::path root, std::uint64_t max_file_size = 0);

        std::filesystem::path root() const;
        std::filesystem::path completed_root() const;

        /// Final path for a destination identifier. Escapes, empty names, existing
        /// directories and paths running through an existing file are rejected.
        std::filesystem::path resolve_destination(const std::string &destination) const;

        void check_size_policy(std::uint64_t file_size) const;

        void write_metadata(const std::filesystem::path &final_path, const uplink::protocol::CompletedUpload &upload) const;

        std::vector<uplink::protocol::CompletedUpload> list_completed() const;

        static std::filesystem::path metadata_path(const std::filesystem::path &final_path);

    private:
        std::filesystem::path base_;
        std::filesystem::path completed_;
        std::uint64_t max_file_size_;
    };

} // namespace uplink::server
