/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the logging system
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <algorithm>
#include <cctype>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace logfunnel
{

// Channel transport constants
// One tagged record travels as one datagram. Records whose encoding exceeds
// MAX_FRAME_SIZE get their message and exception text shortened until they fit.
inline constexpr size_t MAX_FRAME_SIZE         = 64 * 1024;
inline constexpr size_t MAX_TRUNCATION_ROUNDS  = 4;
inline constexpr const char *TRUNCATION_MARKER = "...[truncated]";

// Initial capacity of a sink's formatting buffer
inline constexpr size_t LOG_SINK_BUFFER_SIZE = 4 * 1024;

/**
 * @brief Concept for types that can be logged
 * @tparam T The type to check
 */
template <typename T>
concept Loggable = requires(T value) {
    { fmt::format("{}", value) } -> std::convertible_to<std::string>;
};

/**
 * @brief Enumeration of available log levels in ascending order of severity
 *
 * notset only makes sense as a logger or handler threshold: a logger at notset
 * inherits the backbone's minimum dispatch level, a handler at notset accepts
 * everything.
 */
enum class log_level : int8_t
{
    notset = -2, ///< Inherit / accept all
    nolog  = -1, ///< No logging
    trace  = 0,  ///< Finest-grained information
    debug  = 1,  ///< Debugging information
    info   = 2,  ///< General information
    warn   = 3,  ///< Warning messages
    error  = 4,  ///< Error messages
    fatal  = 5,  ///< Critical errors
};

/**
 * @brief Lowest level a record can carry. Installing an intercept handler
 * drops the backbone to this level so nothing is filtered before it.
 */
inline constexpr log_level LOWEST_LOG_LEVEL = log_level::trace;

/**
 * @brief Backbone minimum dispatch level before anything reconfigures it
 */
inline constexpr log_level DEFAULT_BACKBONE_LEVEL = log_level::info;

// Log level names for formatting
inline const char *log_level_names[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};

inline const std::array<const char *, 6> log_level_colors = {
    "\033[37m", // trace
    "\033[36m", // debug
    "\033[32m", // info
    "\033[33m", // warn
    "\033[31m", // error
    "\033[35m", // fatal
};

/**
 * @brief True for the levels a record can actually carry (trace..fatal)
 */
constexpr bool is_record_level(log_level level) noexcept
{
    return level >= log_level::trace && level <= log_level::fatal;
}

/**
 * @brief Upper-case label used by formatters ("INFO", "WARN", ...)
 */
inline const char *log_level_label(log_level level) noexcept
{
    if (is_record_level(level)) return log_level_names[static_cast<int>(level)];
    return level == log_level::notset ? "NOTSET" : "NOLOG";
}

/**
 * @brief Convert string to log_level
 * @param str Level name (case insensitive)
 * @return Corresponding log_level, or log_level::nolog if invalid
 *
 * Recognized values: "trace", "debug", "info", "warn", "warning", "error", "fatal",
 * "critical", "notset", "nolog", "off", "none"
 */
inline log_level log_level_from_string(const char *str)
{
    if (!str) return log_level::nolog;

    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error") return log_level::error;
    if (lower == "fatal" || lower == "critical") return log_level::fatal;
    if (lower == "notset") return log_level::notset;
    if (lower == "nolog" || lower == "off" || lower == "none") return log_level::nolog;

    return log_level::nolog;
}

/**
 * @brief True if str names a level, including the explicit nolog spellings
 */
inline bool is_log_level_name(const char *str)
{
    if (!str) return false;

    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return log_level_from_string(str) != log_level::nolog || lower == "nolog" || lower == "off" || lower == "none";
}

/**
 * @brief Convert log_level to string
 * @param level The log level
 * @return String representation of the level
 */
inline const char *string_from_log_level(log_level level)
{
    switch (level)
    {
    case log_level::trace: return "trace";
    case log_level::debug: return "debug";
    case log_level::info: return "info";
    case log_level::warn: return "warn";
    case log_level::error: return "error";
    case log_level::fatal: return "fatal";
    case log_level::nolog: return "nolog";
    case log_level::notset: return "notset";
    default: return "unknown";
    }
}

} // namespace logfunnel
