/**
 * @file log.hpp
 * @brief Cross-process log aggregation for forking applications
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This library provides:
 * - Named loggers with levels, output handlers and propagation to a process-wide backbone
 * - Sinks composed of a formatter, a writer and an optional filter
 * - Preconfigured console, file and console+file loggers
 * - Aggregation sessions that funnel every record of a process tree into one sink logger
 * - Worker processes that inherit the running aggregation before their code runs
 *
 * Basic Usage:
 * @code
 * auto &lg = get_logger("app");
 * lg.info("Application started");
 * LOG(lg, warn) << "Temperature " << temp << " exceeds " << max_temp;
 * LOG(lg, info).add("user_id", 123) << "Login successful";
 * @endcode
 *
 * Aggregation:
 * @code
 * log_funnel funnel({.path = "/var/log/run.log"});   // console + file
 * scoped_aggregation session(funnel);
 *
 * get_logger("db").info("connected");
 * // LOGFUNNEL INFO [LOGFUNNEL] - connected
 *
 * auto worker = process_context::instance().create([] { get_logger("job").warn("slow"); });
 * worker->start();
 * worker->join();
 * // LOGFUNNEL WARN [LOGFUNNEL PID 4242] - slow
 * @endcode
 *
 * How records flow:
 * - A logger runs its own handlers, then the backbone's handlers
 * - An aggregation session installs an intercept_handler on the backbone
 * - The handler sends (pid, record) over a socket channel shared with forked workers
 * - The session's consumer thread rewrites the message with the origin and hands the
 *   record to the sink logger, marked handled so no session picks it up again
 *
 * Runtime Level Control:
 * @code
 * logger_registry::instance().configure_from_string("info,net*=debug,db=off");
 * logger_registry::instance().configure_from_env("LOGFUNNEL_LEVEL");
 * @endcode
 *
 * Log Levels (in order of severity):
 * - trace: Finest-grained debugging information
 * - debug: Debugging information
 * - info:  General informational messages
 * - warn:  Warning messages
 * - error: Error messages
 * - fatal: Critical errors requiring immediate attention
 *
 * Thread Safety:
 * - All logging operations are thread-safe
 * - Handlers run synchronously on the emitting thread
 * - Log order is preserved within each thread, and within each process across the channel
 * - Sinks serialize their own writes
 *
 * Limitations:
 * - Only workers created through a process_context take part in aggregation
 * - fork() copies the calling thread only, see log_process.hpp
 * - Delivery is best effort. A full channel drops records, see channel::stats()
 */
#pragma once

#include "fmt_config.hpp"        // IWYU pragma: keep
#include "log_version.hpp"       // IWYU pragma: keep
#include "log_types.hpp"         // IWYU pragma: keep
#include "log_errors.hpp"        // IWYU pragma: keep
#include "log_record.hpp"        // IWYU pragma: keep
#include "log_handler.hpp"       // IWYU pragma: keep
#include "log_sink.hpp"          // IWYU pragma: keep
#include "log_formatters.hpp"    // IWYU pragma: keep
#include "log_writers.hpp"       // IWYU pragma: keep
#include "log_sink_filters.hpp"  // IWYU pragma: keep
#include "log_sinks.hpp"         // IWYU pragma: keep
#include "log_backbone.hpp"      // IWYU pragma: keep
#include "log_logger.hpp"        // IWYU pragma: keep
#include "log_registry.hpp"      // IWYU pragma: keep
#include "log_line.hpp"          // IWYU pragma: keep
#include "log_presets.hpp"       // IWYU pragma: keep
#include "log_channel.hpp"       // IWYU pragma: keep
#include "log_intercept.hpp"     // IWYU pragma: keep
#include "log_process.hpp"       // IWYU pragma: keep
#include "log_aggregator.hpp"    // IWYU pragma: keep

/**
 * @brief Stream style logging on a registry logger looked up by name
 *
 * The lookup happens once per call site and is cached in a static.
 *
 * @code
 * LOG_NAMED("network", info) << "Connection established";
 * @endcode
 */
#define LOG_NAMED(_name, _level)                                                                  \
    [&]() -> ::logfunnel::log_line                                                                \
    {                                                                                             \
        static ::logfunnel::logger &_named_logger = ::logfunnel::get_logger(_name);               \
        return ::logfunnel::log_line(_named_logger, ::logfunnel::log_level::_level);              \
    }()
