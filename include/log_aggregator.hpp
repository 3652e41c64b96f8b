/**
 * @file log_aggregator.hpp
 * @brief Aggregation session: intercept, transport and consume records for one sink logger
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * While a log_aggregator is started, every record emitted in this process and
 * in workers created through its process_context is delivered to the sink
 * logger with its message rewritten to "[<sink> PID <pid>] - <message>"
 * (the PID part only for records from other processes).
 *
 * @code
 * auto &sink = get_console_logger("MAIN");
 * log_aggregator aggregator(sink);
 * {
 *     scoped_aggregation session(aggregator);
 *     get_logger("db").info("connected");          // MAIN ... [MAIN] - connected
 *     auto w = process_context::instance().create([] { get_logger("job").info("done"); });
 *     w->start();
 *     w->join();                                     // MAIN ... [MAIN PID 4242] - done
 * }
 * @endcode
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

#include "fmt_config.hpp" // IWYU pragma: keep

#include "log_types.hpp"
#include "log_errors.hpp"
#include "log_utils.hpp"
#include "log_record.hpp"
#include "log_backbone.hpp"
#include "log_logger.hpp"
#include "log_registry.hpp"
#include "log_presets.hpp"
#include "log_writers.hpp"
#include "log_channel.hpp"
#include "log_intercept.hpp"
#include "log_process.hpp"

namespace logfunnel
{

/**
 * @brief Consumer counters, cumulative over all sessions of an aggregator
 */
struct aggregation_stats
{
    uint64_t forwarded;         ///< Records dispatched into the sink
    uint64_t below_level;       ///< Dropped by the sink's current level
    uint64_t echoes;            ///< Sink's own local records, suppressed
    uint64_t dispatch_failures; ///< Sink dispatch threw
};

class log_aggregator
{
  public:
    explicit log_aggregator(logger &sink,
                            log_backbone &backbone     = log_backbone::global(),
                            process_context &processes = process_context::instance())
    : sink_(&sink), backbone_(&backbone), processes_(&processes), my_pid_(detail::current_pid())
    {
    }

    virtual ~log_aggregator()
    {
        try
        {
            stop();
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "logfunnel: failed to stop aggregation for '%s': %s\n", sink_->name().c_str(), e.what());
        }
    }

    log_aggregator(const log_aggregator &)            = delete;
    log_aggregator &operator=(const log_aggregator &) = delete;

    logger &sink() const noexcept { return *sink_; }

    /**
     * @brief Process the aggregator was created in; records from anywhere else get a PID attribution
     */
    pid_t creating_pid() const noexcept { return my_pid_; }

    bool started() const
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        return handler_ != nullptr;
    }

    /**
     * @brief Begin a session. No-op while started.
     *
     * Creates the channel, installs an intercept handler at the sink's
     * effective level, substitutes the intercepting worker factory and starts
     * the consumer thread. If the thread cannot be started the other steps
     * are undone, the failure is reported on stderr and false is returned.
     *
     * @return true if a session is running afterwards
     * @throws std::runtime_error if the channel cannot be created
     */
    bool start()
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (handler_) return true;

        auto input   = std::make_shared<channel>();
        auto handler = intercept_handler::create(sink_->effective_level(), input, *backbone_);
        handler->install();

        auto previous = processes_->exchange_factory(std::make_shared<intercepting_process_factory>(*backbone_));

        try
        {
            consumer_ = launch_consumer(input);
        }
        catch (const std::system_error &e)
        {
            fmt::print(stderr, "logfunnel: failed to start aggregation consumer for '{}': {}\n", sink_->name(), e.what());
            input->close();
            handler->uninstall();
            processes_->exchange_factory(std::move(previous));
            return false;
        }

        channel_          = std::move(input);
        handler_          = std::move(handler);
        previous_factory_ = std::move(previous);
        return true;
    }

    /**
     * @brief End the session. No-op while not started.
     *
     * Blocks until the consumer has delivered everything that reached the
     * channel before it was closed.
     */
    void stop()
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!handler_) return;

        channel_->close();
        if (consumer_.joinable()) consumer_.join();

        handler_->uninstall();
        processes_->exchange_factory(std::move(previous_factory_));

        consumer_ = std::thread();
        handler_.reset();
        channel_.reset();
    }

    aggregation_stats stats() const noexcept
    {
        return {
            .forwarded         = forwarded_.load(std::memory_order_relaxed),
            .below_level       = below_level_.load(std::memory_order_relaxed),
            .echoes            = echoes_.load(std::memory_order_relaxed),
            .dispatch_failures = dispatch_failures_.load(std::memory_order_relaxed),
        };
    }

  protected:
    /**
     * @brief Start the consumer thread for a session's channel
     * @throws std::system_error if the thread cannot be created
     */
    virtual std::thread launch_consumer(std::shared_ptr<channel> input)
    {
        return std::thread([this, input] { consume(*input); });
    }

    /**
     * @brief Drain a channel into the sink until it is closed and empty
     */
    void consume(channel &input)
    {
        bool failure_reported = false;

        for (auto &item : input.records())
        {
            auto &record = item.record;

            // Level may have changed since the handler was installed
            if (!sink_->is_enabled_for(record.level))
            {
                below_level_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            bool local = item.origin_pid == my_pid_;
            if (local && record.logger_name == sink_->name())
            {
                echoes_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            if (local) { record.message = fmt::format("[{}] - {}", sink_->name(), record.message); }
            else { record.message = fmt::format("[{} PID {}] - {}", sink_->name(), item.origin_pid, record.message); }

            intercept_handler::mark_handled(record);

            try
            {
                sink_->handle(record);
                forwarded_.fetch_add(1, std::memory_order_relaxed);
            }
            catch (const std::exception &e)
            {
                dispatch_failures_.fetch_add(1, std::memory_order_relaxed);
                if (!failure_reported)
                {
                    failure_reported = true;
                    fmt::print(stderr, "logfunnel: sink '{}' failed to handle a record: {}\n", sink_->name(), e.what());
                }
            }
        }
    }

  private:
    logger *sink_;
    log_backbone *backbone_;
    process_context *processes_;
    pid_t my_pid_;

    mutable std::mutex lifecycle_mutex_;
    std::shared_ptr<channel> channel_;
    std::shared_ptr<intercept_handler> handler_;
    std::shared_ptr<process_factory> previous_factory_;
    std::thread consumer_;

    std::atomic<uint64_t> forwarded_{0};
    std::atomic<uint64_t> below_level_{0};
    std::atomic<uint64_t> echoes_{0};
    std::atomic<uint64_t> dispatch_failures_{0};
};

/**
 * @brief Runs an aggregation session for the lifetime of a scope
 *
 * @code
 * {
 *     scoped_aggregation session(aggregator);
 *     run_jobs();
 * } // stopped here, also when run_jobs() throws
 * @endcode
 */
class scoped_aggregation
{
  public:
    explicit scoped_aggregation(log_aggregator &aggregator) : aggregator_(aggregator) { aggregator_.start(); }

    ~scoped_aggregation()
    {
        try
        {
            aggregator_.stop();
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "logfunnel: failed to stop aggregation: %s\n", e.what());
        }
    }

    scoped_aggregation(const scoped_aggregation &)            = delete;
    scoped_aggregation &operator=(const scoped_aggregation &) = delete;

    bool started() const { return aggregator_.started(); }

  private:
    log_aggregator &aggregator_;
};

/**
 * @brief Where a log_funnel sends its output
 *
 * @code
 * log_funnel funnel({.path = "/tmp/run.log", .mode = file_mode::truncate, .level = log_level::debug});
 * @endcode
 */
struct funnel_config
{
    std::optional<std::string> path; ///< Log file, none for console only
    file_mode mode  = file_mode::append;
    log_level level = log_level::info;
    std::optional<bool> console;     ///< Unset: console only when there is no path
    std::string name = "LOGFUNNEL";  ///< Sink logger name
};

/**
 * @brief Aggregator that builds its own console and/or file sink logger
 */
class log_funnel : public log_aggregator
{
  public:
    /**
     * @throws invalid_configuration_error if neither a path nor console output is requested
     * @throws std::runtime_error if the log file cannot be opened
     */
    explicit log_funnel(const funnel_config &config         = {},
                        logger_registry &registry          = logger_registry::instance(),
                        process_context &processes         = process_context::instance())
    : log_aggregator(make_sink(config, registry), registry.backbone(), processes)
    {
    }

  private:
    static logger &make_sink(const funnel_config &config, logger_registry &registry)
    {
        bool console = config.console.value_or(!config.path.has_value());

        if (!config.path)
        {
            if (!console) { throw invalid_configuration_error("log_funnel needs a file path when console output is disabled"); }
            return get_console_logger(config.name, config.level, registry);
        }

        if (console) { return get_file_and_console_logger(config.name, *config.path, config.mode, config.level, registry); }
        return get_file_logger(config.name, *config.path, config.mode, config.level, registry);
    }
};

} // namespace logfunnel
