/**
 * @file log_handler.hpp
 * @brief Handler interface and the copy-on-write handler set shared by loggers and the backbone
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <memory>
#include <mutex>
#include <vector>

#include "log_types.hpp"
#include "log_record.hpp"

namespace logfunnel
{

/**
 * @brief Base class for everything that consumes records
 *
 * Output sinks and the aggregation intercept handler both derive from this.
 * handle() applies the handler's own threshold and then calls emit().
 */
class log_handler
{
  public:
    explicit log_handler(log_level level = log_level::notset) : level_(level) {}
    virtual ~log_handler() = default;

    log_handler(const log_handler &)            = delete;
    log_handler &operator=(const log_handler &) = delete;

    log_level level() const noexcept { return level_.load(std::memory_order_relaxed); }
    void set_level(log_level level) noexcept { level_.store(level, std::memory_order_relaxed); }

    /**
     * @brief Check a record level against this handler's threshold
     *
     * notset accepts everything, nolog accepts nothing.
     */
    bool accepts(log_level level) const noexcept
    {
        auto threshold = this->level();
        if (threshold == log_level::notset) return true;
        if (threshold == log_level::nolog) return false;
        return level >= threshold;
    }

    void handle(log_record &record)
    {
        if (accepts(record.level)) { emit(record); }
    }

  protected:
    virtual void emit(log_record &record) = 0;

  private:
    std::atomic<log_level> level_;
};

/**
 * @brief Handler that drops everything
 *
 * Attached to loggers that were configured without handlers so they count as
 * configured without producing output of their own.
 */
class null_handler final : public log_handler
{
  protected:
    void emit(log_record &) override {}
};

/**
 * @brief Ordered set of handlers with copy-on-write snapshots
 *
 * Readers copy the current shared configuration under a short lock and run
 * the handlers outside of it, so a handler may itself modify the set (the
 * intercept handler does on install) without deadlocking dispatch.
 * Modifications build a new configuration and swap it in.
 */
class handler_list
{
  public:
    using handler_ptr = std::shared_ptr<log_handler>;

    /**
     * @brief Immutable handler configuration
     */
    struct handler_config
    {
        std::vector<handler_ptr> handlers;

        std::shared_ptr<handler_config> copy() const
        {
            auto new_config      = std::make_shared<handler_config>();
            new_config->handlers = handlers; // Copies shared_ptr, not the handlers
            return new_config;
        }
    };

    handler_list() : config_(std::make_shared<handler_config>()) {}

    /**
     * @brief Append a handler
     * @return false if this exact handler is already present
     */
    bool add(handler_ptr handler)
    {
        if (!handler) return false;

        std::lock_guard<std::mutex> lock(mutex_);
        if (contains_locked(*handler)) return false;

        auto new_config = config_->copy();
        new_config->handlers.push_back(std::move(handler));
        config_ = std::move(new_config);
        return true;
    }

    /**
     * @brief Remove a handler by identity
     * @return false if the handler was not present
     */
    bool remove(const log_handler &handler)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!contains_locked(handler)) return false;

        auto new_config = config_->copy();
        auto &hs        = new_config->handlers;
        hs.erase(std::remove_if(hs.begin(), hs.end(), [&](const handler_ptr &h) { return h.get() == &handler; }), hs.end());
        config_ = std::move(new_config);
        return true;
    }

    void replace(std::vector<handler_ptr> handlers)
    {
        auto new_config = std::make_shared<handler_config>();
        for (auto &h : handlers)
        {
            if (h) new_config->handlers.push_back(std::move(h));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        config_ = std::move(new_config);
    }

    void clear() { replace({}); }

    bool contains(const log_handler &handler) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return contains_locked(handler);
    }

    bool empty() const { return snapshot()->handlers.empty(); }

    std::shared_ptr<const handler_config> snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_;
    }

    std::vector<handler_ptr> handlers() const { return snapshot()->handlers; }

    /**
     * @brief Run every handler on the record
     *
     * A throwing handler is reported on stderr and skipped. Emitting a log
     * record must never fail the code that emitted it.
     */
    void dispatch(log_record &record) const
    {
        auto config = snapshot();
        for (const auto &handler : config->handlers)
        {
            try
            {
                handler->handle(record);
            }
            catch (const std::exception &e)
            {
                std::fprintf(stderr, "logfunnel: handler failed for logger '%s': %s\n", record.logger_name.c_str(), e.what());
            }
        }
    }

    /**
     * @brief Lock held across fork() so the child never inherits a half-made update
     */
    std::unique_lock<std::mutex> lock_for_fork() { return std::unique_lock<std::mutex>(mutex_); }

  private:
    bool contains_locked(const log_handler &handler) const
    {
        const auto &hs = config_->handlers;
        return std::any_of(hs.begin(), hs.end(), [&](const handler_ptr &h) { return h.get() == &handler; });
    }

    mutable std::mutex mutex_;
    std::shared_ptr<handler_config> config_;
};

} // namespace logfunnel
