/**
 * @file log_sink_filters.hpp
 * @brief Per-sink filters for selective record processing
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <initializer_list>
#include <string>
#include <vector>

#include <robin_hood.h>
#include "log_types.hpp"
#include "log_record.hpp"
#include "log_utils.hpp"

namespace logfunnel
{

/**
 * @brief Filter that accepts all records (no filtering)
 *
 * Default for the sink factories. The compiler removes the check entirely.
 */
struct no_filter final
{
    bool should_process(const log_record &) const noexcept { return true; }
};

/**
 * @brief Only records with level >= min_level
 *
 * @code
 * auto console = make_stderr_sink(level_filter{log_level::warn});
 * @endcode
 */
struct level_filter final
{
    log_level min_level;

    bool should_process(const log_record &record) const noexcept { return record.level >= min_level; }
};

/**
 * @brief Only records with level <= max_level
 */
struct max_level_filter final
{
    log_level max_level;

    bool should_process(const log_record &record) const noexcept { return record.level <= max_level; }
};

/**
 * @brief Only records with min_level <= level <= max_level
 *
 * @code
 * auto info_sink = make_file_sink("info.log", file_mode::append,
 *     level_range_filter{log_level::debug, log_level::info});
 * @endcode
 */
struct level_range_filter final
{
    log_level min_level;
    log_level max_level;

    bool should_process(const log_record &record) const noexcept
    {
        return record.level >= min_level && record.level <= max_level;
    }
};

/**
 * @brief Only records from the listed loggers
 *
 * Exact names are looked up in a hash set, names containing '*' are kept as
 * wildcard patterns (see detail::wildcard_match).
 *
 * @code
 * auto net_sink = make_file_sink("net.log", file_mode::append, logger_filter{{"net.client", "net.server*"}});
 * @endcode
 */
struct logger_filter final
{
    robin_hood::unordered_set<std::string> exact_names;
    std::vector<std::string> patterns;

    logger_filter(std::initializer_list<std::string> names = {})
    {
        for (const auto &name : names) { add(name); }
    }

    logger_filter &add(const std::string &name)
    {
        if (name.find('*') != std::string::npos) { patterns.push_back(name); }
        else { exact_names.insert(name); }
        return *this;
    }

    bool should_process(const log_record &record) const
    {
        if (exact_names.find(record.logger_name) != exact_names.end()) return true;
        for (const auto &pattern : patterns)
        {
            if (detail::wildcard_match(record.logger_name, pattern)) return true;
        }
        return false;
    }
};

/**
 * @brief Drop records from the listed loggers
 */
struct logger_exclude_filter final
{
    logger_filter excluded;

    logger_exclude_filter(std::initializer_list<std::string> names = {}) : excluded(names) {}

    bool should_process(const log_record &record) const { return !excluded.should_process(record); }
};

} // namespace logfunnel
