#include "uplink/server/filesystem.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "uplink/file_io.hpp"

namespace uplink::server
{

    FilesystemError::FilesystemError(uplink::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        constexpr auto kCompletedDir = "completed";
        constexpr std::string_view kMetadataSuffix = ".metadata.json";

        std::uint64_t to_unix_time(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            const auto sctp = time_point_cast<seconds>(time - std::filesystem::file_time_type::clock::now() +
                                                       std::chrono::system_clock::now());
            return static_cast<std::uint64_t>(sctp.time_since_epoch().count());
        }

        bool ends_with(const std::string &value, std::string_view suffix)
        {
            return value.size() >= suffix.size() &&
                   value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        bool is_scratch_file(const std::string &name)
        {
            return name.find(".part-") != std::string::npos || name.find(".tmp-") != std::string::npos;
        }

        bool occupied_by_file(const std::filesystem::path &path)
        {
            std::error_code ec;
            const auto status = std::filesystem::status(path, ec);
            return !ec && std::filesystem::exists(status) && !std::filesystem::is_directory(status);
        }

    } // namespace

    Filesystem::Filesystem(std::filesystem::path root, std::uint64_t max_file_size)
        : base_(std::move(root)), completed_(base_ / kCompletedDir), max_file_size_(max_file_size)
    {
        std::filesystem::create_directories(base_);
        std::filesystem::create_directories(completed_);
    }

    std::filesystem::path Filesystem::root() const
    {
        return base_;
    }

    std::filesystem::path Filesystem::completed_root() const
    {
        return completed_;
    }

    std::filesystem::path Filesystem::resolve_destination(const std::string &destination) const
    {
        std::filesystem::path relative = destination;
        if (!destination.empty() && relative.is_absolute())
        {
            throw FilesystemError(uplink::ErrorCode::Rejected, "Destination must be a relative path");
        }

        std::filesystem::path sanitized = completed_;
        bool has_component = false;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw FilesystemError(uplink::ErrorCode::Rejected, "Path traversal detected");
            }
            if (has_component && occupied_by_file(sanitized))
            {
                throw FilesystemError(uplink::ErrorCode::Rejected,
                                      "Destination parent " + sanitized.lexically_relative(completed_).generic_string() +
                                          " is a file");
            }
            sanitized /= part;
            has_component = true;
        }
        if (!has_component)
        {
            throw FilesystemError(uplink::ErrorCode::Rejected, "Destination is empty");
        }
        const auto filename = sanitized.filename().string();
        if (ends_with(filename, kMetadataSuffix) || is_scratch_file(filename))
        {
            throw FilesystemError(uplink::ErrorCode::Rejected, "Destination name is reserved");
        }
        std::error_code ec;
        if (std::filesystem::is_directory(sanitized, ec))
        {
            throw FilesystemError(uplink::ErrorCode::Rejected, "Destination " + destination + " is a directory");
        }
        return sanitized;
    }

    void Filesystem::check_size_policy(std::uint64_t file_size) const
    {
        if (max_file_size_ != 0 && file_size > max_file_size_)
        {
            throw FilesystemError(uplink::ErrorCode::Rejected,
                                  "File of " + std::to_string(file_size) + " bytes exceeds limit of " +
                                      std::to_string(max_file_size_));
        }
    }

    void Filesystem::write_metadata(const std::filesystem::path &final_path,
                                    const uplink::protocol::CompletedUpload &upload) const
    {
        const nlohmann::json json = upload;
        file_io::write_file_atomically(metadata_path(final_path), json.dump(2));
    }

    std::vector<uplink::protocol::CompletedUpload> Filesystem::list_completed() const
    {
        std::vector<uplink::protocol::CompletedUpload> uploads;
        for (const auto &entry : std::filesystem::recursive_directory_iterator(completed_))
        {
            if (!entry.is_regular_file())
            {
                continue;
            }
            const auto name = entry.path().filename().string();
            if (ends_with(name, kMetadataSuffix) || is_scratch_file(name))
            {
                continue;
            }

            uplink::protocol::CompletedUpload upload{};
            const auto sidecar = metadata_path(entry.path());
            if (std::filesystem::exists(sidecar))
            {
                try
                {
                    upload = nlohmann::json::parse(file_io::read_text_file(sidecar)).get<uplink::protocol::CompletedUpload>();
                }
                catch (const std::exception &ex)
                {
                    spdlog::warn("Ignoring unreadable metadata {}: {}", sidecar.string(), ex.what());
                }
            }
            upload.destination = entry.path().lexically_relative(completed_).generic_string();
            upload.size = entry.file_size();
            if (upload.completed_at == 0)
            {
                upload.completed_at = to_unix_time(entry.last_write_time());
            }
            uploads.push_back(std::move(upload));
        }
        std::sort(uploads.begin(), uploads.end(), [](const auto &lhs, const auto &rhs)
                  { return lhs.completed_at > rhs.completed_at; });
        return uploads;
    }

    std::filesystem::path Filesystem::metadata_path(const std::filesystem::path &final_path)
    {
        auto path = final_path;
        path += kMetadataSuffix;
        return path;
    }

} // namespace uplink::server
