/**
 * @file log_writers.hpp
 * @brief Log output writer implementations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdio>
#include <cstring>
#include <string>
#include <stdexcept>
#include <unistd.h> // For write() and STDOUT_FILENO
#include <fcntl.h>
#include <errno.h>

namespace logfunnel
{

/**
 * @brief How a file sink opens its target
 */
enum class file_mode
{
    append,   ///< Keep existing content ("a")
    truncate, ///< Start from an empty file ("w")
};

/**
 * @brief Parse "a"/"append" or "w"/"truncate"
 * @throws std::invalid_argument for anything else
 */
inline file_mode file_mode_from_string(const std::string &mode)
{
    if (mode == "a" || mode == "append") return file_mode::append;
    if (mode == "w" || mode == "truncate") return file_mode::truncate;
    throw std::invalid_argument("Unknown file mode: " + mode);
}

class file_writer
{
  public:
    file_writer(const std::string &filename, file_mode mode = file_mode::append)
    : filename_(filename), fd_(-1), close_fd_(true)
    {
        int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (mode == file_mode::append ? O_APPEND : O_TRUNC);
        fd_       = open(filename.c_str(), flags, 0644);
        if (fd_ < 0) { throw std::runtime_error("Failed to open log file: " + filename + " - " + std::strerror(errno)); }
    }

    file_writer(int fd, bool close_fd = false) : filename_(describe_fd(fd)), fd_(fd), close_fd_(close_fd) {}

    file_writer(const file_writer &other) : filename_(other.filename_), fd_(-1), close_fd_(other.close_fd_)
    {
        if (other.fd_ >= 0 && other.close_fd_)
        {
            fd_ = dup(other.fd_);
            if (fd_ < 0) { throw std::runtime_error("Failed to dup file descriptor"); }
        }
        else
        {
            fd_       = other.fd_;
            close_fd_ = false;
        }
    }

    file_writer &operator=(const file_writer &other)
    {
        if (this != &other)
        {
            if (close_fd_ && fd_ >= 0) { close(fd_); }

            filename_ = other.filename_;
            close_fd_ = other.close_fd_;

            if (other.fd_ >= 0 && other.close_fd_)
            {
                fd_ = dup(other.fd_);
                if (fd_ < 0) { throw std::runtime_error("Failed to dup file descriptor"); }
            }
            else
            {
                fd_       = other.fd_;
                close_fd_ = false;
            }
        }
        return *this;
    }

    file_writer(file_writer &&other) noexcept
    : filename_(std::move(other.filename_)), fd_(other.fd_), close_fd_(other.close_fd_)
    {
        other.fd_       = -1;
        other.close_fd_ = false;
    }

    ~file_writer()
    {
        if (close_fd_ && fd_ >= 0)
        {
            close(fd_);
            fd_ = -1;
        }
    }

    ssize_t write(const char *data, size_t len) const
    {
        if (fd_ < 0) { return -1; }

        size_t total_written = 0;
        while (total_written < len)
        {
            ssize_t written = ::write(fd_, data + total_written, len - total_written);
            if (written < 0)
            {
                if (errno == EINTR) { continue; }
                perror("Failed to write to log file");
                return -1;
            }
            total_written += written;
        }
        return total_written;
    }

    /**
     * @brief File name, or "<stdout>"/"<stderr>"/"<fd N>" for wrapped descriptors
     */
    const std::string &target() const noexcept { return filename_; }

  private:
    static std::string describe_fd(int fd)
    {
        if (fd == STDOUT_FILENO) return "<stdout>";
        if (fd == STDERR_FILENO) return "<stderr>";
        return "<fd " + std::to_string(fd) + ">";
    }

    std::string filename_; ///< File name for logging
    int fd_{-1};           ///< File descriptor for logging
    bool close_fd_{false}; ///< Whether to close fd on destruction
};

class discard_writer
{
  public:
    discard_writer() = default;

    ssize_t write(const char *, size_t) const { return 0; }

    std::string target() const { return "<discard>"; }
};

} // namespace logfunnel
