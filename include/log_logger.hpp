/**
 * @file log_logger.hpp
 * @brief Named logger with its own level, handlers and backbone propagation
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fmt_config.hpp" // IWYU pragma: keep

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_handler.hpp"
#include "log_backbone.hpp"

namespace logfunnel
{

class logger_registry;

/**
 * @brief A named source and destination of records
 *
 * Emission checks the logger's effective level, builds a record and passes
 * it to handle(). handle() runs the logger's own handlers and then, unless
 * propagation is off, the backbone's handlers.
 *
 * Loggers are normally obtained from a logger_registry, which owns them and
 * keeps references stable for the life of the registry.
 *
 * @code
 * auto &lg = get_logger("net.client");
 * lg.set_level(log_level::debug);
 * lg.info("connected to {}:{}", host, port);
 * LOG(lg, warn) << "retrying in " << delay_ms << "ms";
 * @endcode
 */
class logger
{
  public:
    using handler_ptr = std::shared_ptr<log_handler>;

    explicit logger(std::string name, log_backbone &backbone = log_backbone::global(), logger_registry *registry = nullptr)
    : name_(std::move(name)), backbone_(&backbone), registry_(registry)
    {
    }

    logger(const logger &)            = delete;
    logger &operator=(const logger &) = delete;

    const std::string &name() const noexcept { return name_; }

    log_level level() const noexcept { return level_.load(std::memory_order_relaxed); }
    void set_level(log_level level) noexcept { level_.store(level, std::memory_order_relaxed); }

    /**
     * @brief Own level, or the backbone's minimum dispatch level while notset
     */
    log_level effective_level() const noexcept
    {
        auto own = level();
        return own == log_level::notset ? backbone_->level() : own;
    }

    bool is_enabled_for(log_level level) const noexcept
    {
        if (!is_record_level(level)) return false;
        auto effective = effective_level();
        if (effective == log_level::nolog) return false;
        return effective == log_level::notset || level >= effective;
    }

    bool propagate() const noexcept { return propagate_.load(std::memory_order_relaxed); }
    void set_propagate(bool propagate) noexcept { propagate_.store(propagate, std::memory_order_relaxed); }

    bool add_handler(handler_ptr handler) { return handlers_.add(std::move(handler)); }
    bool remove_handler(const log_handler &handler) { return handlers_.remove(handler); }
    void set_handlers(std::vector<handler_ptr> handlers) { handlers_.replace(std::move(handlers)); }
    void clear_handlers() { handlers_.clear(); }
    std::vector<handler_ptr> handlers() const { return handlers_.handlers(); }
    bool has_handlers() const { return !handlers_.empty(); }

    log_backbone &backbone() const noexcept { return *backbone_; }

    /**
     * @brief Build a record stamped with this logger's name, the time and the calling thread
     */
    log_record make_record(log_level level, std::string message) const { return log_record(name_, level, std::move(message)); }

    /**
     * @brief Dispatch a ready record
     *
     * Does not look at the logger's level. Runs this logger's handlers (each
     * still applies its own threshold) and then the backbone's.
     */
    void handle(log_record &record) const
    {
        handlers_.dispatch(record);
        if (propagate()) { backbone_->dispatch(record); }
    }

    template <typename... Args> void log(log_level level, fmt::format_string<Args...> fmt, Args &&...args) const
    {
        if (!is_enabled_for(level)) return;

        auto record = make_record(level, fmt::format(fmt, std::forward<Args>(args)...));
        handle(record);
    }

    /**
     * @brief Emit a record carrying an exception
     *
     * @code
     * try { connect(); }
     * catch (...) { lg.log_exception(log_level::error, std::current_exception(), "connect failed"); }
     * @endcode
     */
    template <typename... Args>
    void log_exception(log_level level, std::exception_ptr exception, fmt::format_string<Args...> fmt, Args &&...args) const
    {
        if (!is_enabled_for(level)) return;

        auto record      = make_record(level, fmt::format(fmt, std::forward<Args>(args)...));
        record.exception = std::move(exception);
        handle(record);
    }

    template <typename... Args> void trace(fmt::format_string<Args...> fmt, Args &&...args) const
    {
        log(log_level::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void debug(fmt::format_string<Args...> fmt, Args &&...args) const
    {
        log(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void info(fmt::format_string<Args...> fmt, Args &&...args) const
    {
        log(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void warn(fmt::format_string<Args...> fmt, Args &&...args) const
    {
        log(log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void error(fmt::format_string<Args...> fmt, Args &&...args) const
    {
        log(log_level::error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void fatal(fmt::format_string<Args...> fmt, Args &&...args) const
    {
        log(log_level::fatal, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Registry logger named "<name>.<suffix>"
     * @throws illegal_state_error if this logger does not belong to a registry
     */
    logger &child(std::string_view suffix) const; // Defined in log_registry.hpp

  private:
    std::string name_;
    std::atomic<log_level> level_{log_level::notset};
    std::atomic<bool> propagate_{true};
    handler_list handlers_;
    log_backbone *backbone_;
    logger_registry *registry_;
};

} // namespace logfunnel
