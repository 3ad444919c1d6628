/**
 * Uplink - Durable file helpers (POSIX).
 *
 * Writers here only return once the bytes and the directory entry have reached
 * stable storage, so a crash right after a call cannot lose the update.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uplink::file_io
{

    /// Owning wrapper around a file descriptor opened for writing.
    class FileWriter
    {
    public:
        FileWriter() = default;
        explicit FileWriter(const std::filesystem::path &path, bool truncate = true);
        ~FileWriter();

        FileWriter(const FileWriter &) = delete;
        FileWriter &operator=(const FileWriter &) = delete;
        FileWriter(FileWriter &&other) noexcept;
        FileWriter &operator=(FileWriter &&other) noexcept;

        void write(std::span<const std::byte> data);
        void sync();
        void close();

        bool is_open() const noexcept { return fd_ >= 0; }
        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        int fd_{-1};
        std::filesystem::path path_;
    };

    /// Writes `data` to a sibling temp file, fsyncs it, renames it over `target`
    /// and fsyncs the parent directory. Throws std::system_error.
    void write_file_atomically(const std::filesystem::path &target, std::span<const std::byte> data);
    void write_file_atomically(const std::filesystem::path &target, std::string_view text);

    /// rename(2) followed by an fsync of the destination directory.
    void rename_durably(const std::filesystem::path &from, const std::filesystem::path &to);

    void sync_directory(const std::filesystem::path &directory);

    /// Reads exactly `length` bytes at `offset`. Throws std::system_error on I/O
    /// failure and std::runtime_error when the file is shorter than requested.
    std::vector<std::byte> read_range(const std::filesystem::path &path, std::uint64_t offset, std::uint64_t length);

    std::string read_text_file(const std::filesystem::path &path);

} // namespace uplink::file_io
