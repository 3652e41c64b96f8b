/**
 * @file log_channel.hpp
 * @brief Many-producer, single-consumer record transport that works across fork()
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A channel is a connected AF_UNIX SOCK_SEQPACKET socketpair. Every put() sends
 * one tagged record as one JSON datagram on the write end, the single consumer
 * reads datagrams from the read end. The kernel keeps datagram boundaries and
 * per-sender order, so producers in any thread of any process holding the
 * write end never interleave and never need a shared lock.
 *
 * Backpressure is the kernel socket buffer. SO_SNDBUF is raised to
 * CHANNEL_SEND_BUFFER, but the kernel caps it at net.core.wmem_max and charges
 * each datagram its full allocation, roughly 1 KiB even for a short record.
 * With the default wmem_max a burst of a few hundred records against a slow
 * sink is enough to fill it. put() then drops, and stats().dropped counts it.
 *
 * Termination is close-then-drain: close() shuts down the write side of the
 * socket itself, which every process sharing it observes. The reader keeps
 * receiving what was queued before and then sees end-of-stream.
 *
 * @code
 * auto ch = std::make_shared<channel>();
 * ch->put({getpid(), record});
 * ch->close();
 * for (auto &item : ch->records()) { ... }
 * @endcode
 */
#pragma once

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "log_types.hpp"
#include "log_errors.hpp"
#include "log_record.hpp"
#include "log_record_codec.hpp"

namespace logfunnel
{

/**
 * @brief Serializable reference to a channel
 *
 * Plain descriptor numbers. They stay valid in a forked child, which is
 * where channel::attach() turns them back into a producer endpoint.
 */
struct channel_handle
{
    int send_fd{-1};
    int recv_fd{-1};

    bool valid() const noexcept { return send_fd >= 0; }
};

/**
 * @brief Per-endpoint counters, local to the calling process
 */
struct channel_stats
{
    uint64_t put;       ///< Records handed to the transport
    uint64_t dropped;   ///< Records discarded: closed, full or unencodable
    uint64_t truncated; ///< Records that were shortened to fit a frame
    uint64_t received;  ///< Records delivered to the consumer
    uint64_t skipped;   ///< Frames the consumer could not decode
};

namespace detail
{

// Remove at least `count` bytes from the end of s without splitting a UTF-8
// sequence, then append the truncation marker.
inline void truncate_utf8(std::string &s, size_t count)
{
    size_t keep = s.size() > count ? s.size() - count : 0;
    while (keep > 0 && is_utf8_continuation(static_cast<unsigned char>(s[keep]))) { --keep; }
    s.resize(keep);
    s += TRUNCATION_MARKER;
}

} // namespace detail

class channel
{
  public:
    /**
     * @brief Create a fresh channel owning both ends
     * @throws std::runtime_error if the socketpair cannot be created
     */
    channel() : owner_(true)
    {
        int fds[2];
        if (::socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_CLOEXEC, 0, fds) != 0)
        {
            throw std::runtime_error(std::string("Failed to create log channel: ") + std::strerror(errno));
        }
        recv_fd_ = fds[0];
        send_fd_ = fds[1];

        int size = CHANNEL_SEND_BUFFER;
        if (::setsockopt(send_fd_, SOL_SOCKET, SO_SNDBUF, &size, sizeof(size)) != 0) { perror("logfunnel: setsockopt(SO_SNDBUF)"); }

        buffer_.resize(MAX_FRAME_SIZE);
    }

    /**
     * @brief Producer-only endpoint on an existing channel
     *
     * Duplicates the handle's write descriptor, so the endpoint does not
     * depend on whatever object the handle was taken from. close() on an
     * attached endpoint only stops this endpoint; ending the stream is the
     * owner's job.
     *
     * @throws std::runtime_error if the descriptor cannot be duplicated
     */
    static std::shared_ptr<channel> attach(const channel_handle &handle)
    {
        int fd = ::fcntl(handle.send_fd, F_DUPFD_CLOEXEC, 0);
        if (fd < 0) { throw std::runtime_error(std::string("Failed to attach log channel: ") + std::strerror(errno)); }
        return std::shared_ptr<channel>(new channel(fd));
    }

    ~channel()
    {
        if (send_fd_ >= 0) ::close(send_fd_);
        if (recv_fd_ >= 0) ::close(recv_fd_);
    }

    channel(const channel &)            = delete;
    channel &operator=(const channel &) = delete;

    bool owner() const noexcept { return owner_; }

    bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }

    channel_handle handle() const noexcept { return {send_fd_, recv_fd_}; }

    /**
     * @brief Send one record, never blocking and never throwing
     *
     * Records whose encoding exceeds MAX_FRAME_SIZE have their message and
     * exception text cut down, up to MAX_TRUNCATION_ROUNDS times; if that is
     * not enough the record is dropped.
     *
     * @return true if the record was handed to the transport
     */
    bool put(const tagged_record &item) noexcept
    {
        if (closed())
        {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        try
        {
            std::string frame = encode_tagged_record(item);
            if (frame.size() > MAX_FRAME_SIZE && !shrink_to_frame(item, frame))
            {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }

            for (;;)
            {
                ssize_t n = ::send(send_fd_, frame.data(), frame.size(), MSG_DONTWAIT | MSG_NOSIGNAL);
                if (n >= 0) break;
                if (errno == EINTR) continue;

                // EAGAIN: consumer is behind. EPIPE: the owner closed the channel.
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
        }
        catch (const std::exception &)
        {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        put_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    /**
     * @brief Stop accepting records. Idempotent.
     *
     * On the owning endpoint this also ends the stream for the consumer once
     * everything already sent has been read.
     */
    void close() noexcept
    {
        if (closed_.exchange(true, std::memory_order_acq_rel)) return;

        if (owner_ && ::shutdown(send_fd_, SHUT_WR) != 0) { perror("logfunnel: shutdown(log channel)"); }
    }

    /**
     * @brief Blocking read of the next record
     *
     * Only the single consumer may call this. Returns false once the channel
     * was closed and drained, or after a transport failure, which is reported
     * once on stderr. Frames that fail to decode are skipped.
     *
     * @throws illegal_state_error on an attached, producer-only endpoint
     */
    bool receive(tagged_record &out)
    {
        if (recv_fd_ < 0) { throw illegal_state_error("Log channel endpoint has no receive side"); }
        if (exhausted_) return false;

        for (;;)
        {
            ssize_t n = ::recv(recv_fd_, buffer_.data(), buffer_.size(), 0);
            if (n == 0)
            {
                exhausted_ = true;
                return false;
            }
            if (n < 0)
            {
                if (errno == EINTR) continue;

                fmt::print(stderr, "logfunnel: log channel receive failed, stopping aggregation: {}\n", std::strerror(errno));
                exhausted_ = true;
                return false;
            }

            try
            {
                out = decode_tagged_record(std::string_view(buffer_.data(), static_cast<size_t>(n)));
            }
            catch (const std::exception &e)
            {
                skipped_.fetch_add(1, std::memory_order_relaxed);
                if (!decode_reported_)
                {
                    decode_reported_ = true;
                    fmt::print(stderr, "logfunnel: skipping undecodable log frame: {}\n", e.what());
                }
                continue;
            }

            received_.fetch_add(1, std::memory_order_relaxed);
            return true;
        }
    }

    /**
     * @brief Single-pass view of the records still to come
     *
     * Iteration blocks while the channel is empty and ends when it is closed
     * and drained. Once exhausted, every further range is empty.
     */
    class record_range
    {
      public:
        class iterator
        {
          public:
            using iterator_category = std::input_iterator_tag;
            using value_type        = tagged_record;
            using difference_type   = std::ptrdiff_t;
            using pointer           = tagged_record *;
            using reference         = tagged_record &;

            iterator() = default;
            explicit iterator(record_range *range) : range_(range) { advance(); }

            reference operator*() const { return range_->current_; }
            pointer operator->() const { return &range_->current_; }

            iterator &operator++()
            {
                advance();
                return *this;
            }

            void operator++(int) { advance(); }

            friend bool operator==(const iterator &it, std::default_sentinel_t) noexcept { return it.range_ == nullptr; }

          private:
            void advance()
            {
                if (range_ && !range_->channel_->receive(range_->current_)) { range_ = nullptr; }
            }

            record_range *range_{nullptr};
        };

        explicit record_range(channel &ch) : channel_(&ch) {}

        iterator begin() { return iterator(this); }
        std::default_sentinel_t end() const noexcept { return {}; }

      private:
        channel *channel_;
        tagged_record current_;
    };

    record_range records() { return record_range(*this); }

    /**
     * @brief Counters for this endpoint
     *
     * A growing dropped count with an open channel means the consumer falls
     * behind the socket buffer; raise net.core.wmem_max or log less.
     */
    channel_stats stats() const noexcept
    {
        return {
            .put       = put_.load(std::memory_order_relaxed),
            .dropped   = dropped_.load(std::memory_order_relaxed),
            .truncated = truncated_.load(std::memory_order_relaxed),
            .received  = received_.load(std::memory_order_relaxed),
            .skipped   = skipped_.load(std::memory_order_relaxed),
        };
    }

    // Requested kernel send buffer. The kernel caps it at net.core.wmem_max.
    static constexpr int CHANNEL_SEND_BUFFER = 1024 * 1024;

  private:
    explicit channel(int send_fd) : owner_(false), send_fd_(send_fd) {}

    bool shrink_to_frame(const tagged_record &item, std::string &frame)
    {
        tagged_record copy = item;
        const size_t marker = std::strlen(TRUNCATION_MARKER);

        for (size_t round = 0; round < MAX_TRUNCATION_ROUNDS && frame.size() > MAX_FRAME_SIZE; ++round)
        {
            size_t excess = frame.size() - MAX_FRAME_SIZE + marker;
            auto &msg     = copy.record.message;
            auto &exc     = copy.record.exception_text;
            auto &longer  = exc.size() > msg.size() ? exc : msg;
            if (longer.empty()) break;

            detail::truncate_utf8(longer, excess);
            frame = encode_tagged_record(copy);
        }

        if (frame.size() > MAX_FRAME_SIZE) return false;

        truncated_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    bool owner_;
    int send_fd_{-1};
    int recv_fd_{-1};
    std::atomic<bool> closed_{false};

    // Consumer side state, touched only by the consumer thread
    std::vector<char> buffer_;
    bool exhausted_{false};
    bool decode_reported_{false};

    std::atomic<uint64_t> put_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> truncated_{0};
    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> skipped_{0};
};

} // namespace logfunnel
