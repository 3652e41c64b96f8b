/**
 * @file log_line.hpp
 * @brief Stream and format style builder for a single record
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <exception>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fmt_config.hpp" // IWYU pragma: keep

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_logger.hpp"

namespace logfunnel
{

/**
 * @brief Collects one message and emits it through a logger on destruction
 *
 * When the level is disabled for the logger at construction nothing is
 * collected and nothing is emitted.
 *
 * @code
 * LOG(lg, info) << "Processing " << count << " items";
 * LOG(lg, warn).format("Temperature {} exceeds {}", temp, max_temp);
 * LOG(lg, info).add("user_id", 123) << "Login successful";
 * LOG(lg, error).exception(std::current_exception()) << "Request failed";
 * @endcode
 */
class log_line
{
    const logger *logger_; // nullptr when disabled
    log_level level_;
    fmt::memory_buffer buffer_;
    std::vector<log_record::attribute> attributes_;
    std::exception_ptr exception_;
    bool pending_{false};

  public:
    log_line() = delete;

    log_line(const logger &lg, log_level level) : logger_(lg.is_enabled_for(level) ? &lg : nullptr), level_(level) {}

    log_line(log_line &&other) noexcept
    : logger_(std::exchange(other.logger_, nullptr)),
      level_(other.level_),
      buffer_(std::move(other.buffer_)),
      attributes_(std::move(other.attributes_)),
      exception_(std::move(other.exception_)),
      pending_(std::exchange(other.pending_, false))
    {
    }

    log_line(const log_line &)            = delete;
    log_line &operator=(const log_line &) = delete;
    log_line &operator=(log_line &&)      = delete;

    ~log_line() { flush(); }

    bool enabled() const noexcept { return logger_ != nullptr; }

    /**
     * @brief Emit what has been collected so far and start over
     */
    log_line &flush()
    {
        if (!logger_ || !pending_) return *this;

        auto record       = logger_->make_record(level_, fmt::to_string(buffer_));
        record.attributes = std::move(attributes_);
        record.exception  = std::move(exception_);

        buffer_.clear();
        attributes_.clear();
        exception_ = nullptr;
        pending_   = false;

        logger_->handle(record);
        return *this;
    }

    log_line &print(std::string_view str)
    {
        if (!logger_) { return *this; }

        buffer_.append(str.data(), str.data() + str.size());
        pending_ = true;
        return *this;
    }

    template <typename... Args> log_line &format(fmt::format_string<Args...> fmt, Args &&...args)
    {
        if (!logger_) { return *this; }

        fmt::format_to(std::back_inserter(buffer_), fmt, std::forward<Args>(args)...);
        pending_ = true;
        return *this;
    }

    // Generic version for any formattable type
    template <typename T>
        requires Loggable<T>
    log_line &operator<<(const T &value)
    {
        if (!logger_) { return *this; }

        fmt::format_to(std::back_inserter(buffer_), "{}", value);
        pending_ = true;
        return *this;
    }

    template <typename T> log_line &operator<<(T *ptr)
    {
        if (!logger_) { return *this; }

        if (ptr == nullptr) { print("nullptr"); }
        else { format("{}", static_cast<const void *>(ptr)); }
        return *this;
    }

    log_line &operator<<(const char *str) { return str ? print(str) : print("nullptr"); }

    template <typename T> log_line &operator<<(const std::shared_ptr<T> &ptr) { return *this << ptr.get(); }

    template <typename T, typename D> log_line &operator<<(const std::unique_ptr<T, D> &ptr) { return *this << ptr.get(); }

    /**
     * @brief Attach a key/value attribute to the record
     */
    template <typename T>
        requires Loggable<T>
    log_line &add(std::string key, const T &value)
    {
        if (!logger_) { return *this; }

        attributes_.emplace_back(std::move(key), fmt::format("{}", value));
        pending_ = true;
        return *this;
    }

    log_line &exception(std::exception_ptr ptr)
    {
        if (!logger_) { return *this; }

        exception_ = std::move(ptr);
        pending_   = true;
        return *this;
    }
};

} // namespace logfunnel

/**
 * @brief Stream style logging on a logger
 *
 * @code
 * LOG(get_logger("db"), debug) << "query took " << ms << "ms";
 * @endcode
 */
#define LOG(lg, level) ::logfunnel::log_line((lg), ::logfunnel::log_level::level)
