/**
 * @file log_presets.hpp
 * @brief Ready made console, file and console+file loggers
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Each preset fetches the named logger from a registry, replaces its handlers
 * and sets both the logger level and every new handler's level. Calling a
 * preset again for the same name reconfigures the same logger.
 *
 * @code
 * auto &lg = get_file_and_console_logger("app", "/tmp/app.log", file_mode::truncate, log_level::debug);
 * lg.debug("ready");
 * @endcode
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "log_types.hpp"
#include "log_handler.hpp"
#include "log_sinks.hpp"
#include "log_logger.hpp"
#include "log_registry.hpp"

namespace logfunnel
{

namespace detail
{

inline logger &configure_preset(logger_registry &registry, std::string_view name, log_level level,
                                std::vector<std::shared_ptr<log_handler>> handlers)
{
    for (auto &h : handlers) { h->set_level(level); }
    return registry.get_logger(name, level, std::move(handlers));
}

} // namespace detail

/**
 * @brief Logger writing to stderr
 */
inline logger &
get_console_logger(std::string_view name, log_level level = log_level::info, logger_registry &registry = logger_registry::instance())
{
    return detail::configure_preset(registry, name, level, {make_stderr_sink()});
}

/**
 * @brief Logger writing to a file
 * @throws std::runtime_error if the file cannot be opened
 */
inline logger &get_file_logger(std::string_view name,
                               const std::string &path,
                               file_mode mode              = file_mode::append,
                               log_level level             = log_level::info,
                               logger_registry &registry   = logger_registry::instance())
{
    return detail::configure_preset(registry, name, level, {make_file_sink(path, mode)});
}

/**
 * @brief Logger writing to stderr and a file, in that order
 * @throws std::runtime_error if the file cannot be opened
 */
inline logger &get_file_and_console_logger(std::string_view name,
                                           const std::string &path,
                                           file_mode mode            = file_mode::append,
                                           log_level level           = log_level::info,
                                           logger_registry &registry = logger_registry::instance())
{
    return detail::configure_preset(registry, name, level, {make_stderr_sink(), make_file_sink(path, mode)});
}

} // namespace logfunnel
