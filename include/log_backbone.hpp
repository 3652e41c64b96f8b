/**
 * @file log_backbone.hpp
 * @brief Process-wide listener set and minimum dispatch level
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Every logger that propagates hands its records to a backbone after running
 * its own handlers. Handlers registered here therefore observe every record
 * emitted in the process, which is what aggregation hooks into.
 *
 * The global instance is what the default registry and worker factory use.
 * Tests and embedders can create private backbones and pass them explicitly.
 */
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_handler.hpp"

namespace logfunnel
{

class log_backbone
{
  public:
    log_backbone() = default;
    explicit log_backbone(log_level level) : level_(level) {}

    log_backbone(const log_backbone &)            = delete;
    log_backbone &operator=(const log_backbone &) = delete;

    static log_backbone &global()
    {
        static log_backbone instance_;
        return instance_;
    }

    /**
     * @brief Register a listener for every propagated record
     *
     * @warning Uses a copy-on-write handler configuration. Adding and removing
     *          allocates a new configuration each time, dispatch never waits
     *          on it beyond copying a shared pointer.
     *
     * @return false if the handler is already registered
     */
    bool add_handler(std::shared_ptr<log_handler> handler) { return handlers_.add(std::move(handler)); }

    /**
     * @return false if the handler was not registered
     */
    bool remove_handler(const log_handler &handler) { return handlers_.remove(handler); }

    bool has_handler(const log_handler &handler) const { return handlers_.contains(handler); }

    std::vector<std::shared_ptr<log_handler>> handlers() const { return handlers_.handlers(); }

    void clear_handlers() { handlers_.clear(); }

    /**
     * @brief Minimum dispatch level, used by loggers whose own level is notset
     */
    log_level level() const noexcept { return level_.load(std::memory_order_acquire); }

    void set_level(log_level level) noexcept { level_.store(level, std::memory_order_release); }

    /**
     * @brief Run all registered handlers on a record, on the calling thread
     */
    void dispatch(log_record &record) const { handlers_.dispatch(record); }

    /**
     * @brief Block handler-set updates while the caller forks
     */
    std::unique_lock<std::mutex> fork_guard() { return handlers_.lock_for_fork(); }

  private:
    handler_list handlers_;
    std::atomic<log_level> level_{DEFAULT_BACKBONE_LEVEL};
};

} // namespace logfunnel
