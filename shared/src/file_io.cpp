#include "uplink/file_io.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "uplink/crypto.hpp"

namespace uplink::file_io
{

    namespace
    {

        [[noreturn]] void throw_errno(const std::string &what, const std::filesystem::path &path)
        {
            throw std::system_error(errno, std::generic_category(), what + " " + path.string());
        }

        int open_or_throw(const std::filesystem::path &path, int flags, const char *what)
        {
            int fd = -1;
            do
            {
                fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
            } while (fd < 0 && errno == EINTR);
            if (fd < 0)
            {
                throw_errno(what, path);
            }
            return fd;
        }

    } // namespace

    FileWriter::FileWriter(const std::filesystem::path &path, bool truncate)
        : fd_(open_or_throw(path, O_WRONLY | O_CREAT | (truncate ? O_TRUNC : O_APPEND), "open for writing")),
          path_(path)
    {
    }

    FileWriter::~FileWriter()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
        }
    }

    FileWriter::FileWriter(FileWriter &&other) noexcept
        : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_))
    {
    }

    FileWriter &FileWriter::operator=(FileWriter &&other) noexcept
    {
        if (this != &other)
        {
            if (fd_ >= 0)
            {
                ::close(fd_);
            }
            fd_ = std::exchange(other.fd_, -1);
            path_ = std::move(other.path_);
        }
        return *this;
    }

    void FileWriter::write(std::span<const std::byte> data)
    {
        const auto *cursor = reinterpret_cast<const char *>(data.data());
        std::size_t remaining = data.size();
        while (remaining > 0)
        {
            const auto written = ::write(fd_, cursor, remaining);
            if (written < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw_errno("write", path_);
            }
            cursor += written;
            remaining -= static_cast<std::size_t>(written);
        }
    }

    void FileWriter::sync()
    {
        if (::fsync(fd_) != 0)
        {
            throw_errno("fsync", path_);
        }
    }

    void FileWriter::close()
    {
        if (fd_ < 0)
        {
            return;
        }
        const int fd = std::exchange(fd_, -1);
        if (::close(fd) != 0)
        {
            throw_errno("close", path_);
        }
    }

    void write_file_atomically(const std::filesystem::path &target, std::span<const std::byte> data)
    {
        auto temp = target;
        temp += ".tmp-" + crypto::random_hex(4);
        try
        {
            FileWriter writer(temp);
            writer.write(data);
            writer.sync();
            writer.close();
            rename_durably(temp, target);
        }
        catch (...)
        {
            std::error_code ec;
            std::filesystem::remove(temp, ec);
            throw;
        }
    }

    void write_file_atomically(const std::filesystem::path &target, std::string_view text)
    {
        write_file_atomically(target, std::as_bytes(std::span(text.data(), text.size())));
    }

    void rename_durably(const std::filesystem::path &from, const std::filesystem::path &to)
    {
        if (::rename(from.c_str(), to.c_str()) != 0)
        {
            throw_errno("rename to " + to.string() + " from", from);
        }
        sync_directory(to.parent_path().empty() ? std::filesystem::path(".") : to.parent_path());
    }

    void sync_directory(const std::filesystem::path &directory)
    {
        const int fd = open_or_throw(directory, O_RDONLY | O_DIRECTORY, "open directory");
        const int status = ::fsync(fd);
        const int saved_errno = errno;
        ::close(fd);
        if (status != 0)
        {
            errno = saved_errno;
            throw_errno("fsync directory", directory);
        }
    }

    std::vector<std::byte> read_range(const std::filesystem::path &path, std::uint64_t offset, std::uint64_t length)
    {
        const int fd = open_or_throw(path, O_RDONLY, "open for reading");
        std::vector<std::byte> buffer(static_cast<std::size_t>(length));
        std::size_t filled = 0;
        while (filled < buffer.size())
        {
            const auto got = ::pread(fd, reinterpret_cast<char *>(buffer.data()) + filled, buffer.size() - filled,
                                     static_cast<off_t>(offset + filled));
            if (got < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                const int saved_errno = errno;
                ::close(fd);
                errno = saved_errno;
                throw_errno("read", path);
            }
            if (got == 0)
            {
                break;
            }
            filled += static_cast<std::size_t>(got);
        }
        ::close(fd);
        if (filled != buffer.size())
        {
            throw std::runtime_error("Short read from " + path.string() + ": expected " + std::to_string(length) +
                                     " bytes at offset " + std::to_string(offset) + ", got " +
                                     std::to_string(filled));
        }
        return buffer;
    }

    std::string read_text_file(const std::filesystem::path &path)
    {
        const auto size = std::filesystem::file_size(path);
        const auto bytes = read_range(path, 0, size);
        return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    }

} // namespace uplink::file_io
