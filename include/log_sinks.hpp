/**
 * @file log_sinks.hpp
 * @brief Factory functions for creating common log sinks with optional filtering
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include "log_sink.hpp"
#include "log_formatters.hpp"
#include "log_writers.hpp"
#include "log_sink_filters.hpp"
#include <memory>
#include <string>
#include <type_traits>
#include <unistd.h>

namespace logfunnel
{

namespace detail
{

template <typename Formatter, typename Writer, typename Filter>
inline std::shared_ptr<log_sink> make_sink(Formatter formatter, Writer writer, Filter &&filter)
{
    if constexpr (std::is_same_v<std::decay_t<Filter>, no_filter>)
    {
        return std::make_shared<log_sink>(std::move(formatter), std::move(writer));
    }
    else
    {
        return std::make_shared<log_sink>(std::move(formatter), std::move(writer), std::forward<Filter>(filter));
    }
}

} // namespace detail

// Factory functions with optional filtering support via default parameter

template <typename Filter = no_filter> inline std::shared_ptr<log_sink> make_stdout_sink(Filter &&filter = {})
{
    return detail::make_sink(
        text_formatter{
            .use_color   = isatty(STDOUT_FILENO) != 0,
            .add_newline = true,
        },
        file_writer{STDOUT_FILENO},
        std::forward<Filter>(filter));
}

template <typename Filter = no_filter> inline std::shared_ptr<log_sink> make_stderr_sink(Filter &&filter = {})
{
    return detail::make_sink(
        text_formatter{
            .use_color   = false,
            .add_newline = true,
        },
        file_writer{STDERR_FILENO},
        std::forward<Filter>(filter));
}

template <typename Filter = no_filter>
inline std::shared_ptr<log_sink> make_file_sink(const std::string &filename, file_mode mode = file_mode::append, Filter &&filter = {})
{
    return detail::make_sink(
        text_formatter{
            .use_color   = false,
            .add_newline = true,
        },
        file_writer{filename, mode},
        std::forward<Filter>(filter));
}

template <typename Filter = no_filter>
inline std::shared_ptr<log_sink> make_json_file_sink(const std::string &filename, file_mode mode = file_mode::append, Filter &&filter = {})
{
    return detail::make_sink(
        json_formatter{
            .pretty_print = false,
            .add_newline  = true,
        },
        file_writer{filename, mode},
        std::forward<Filter>(filter));
}

} // namespace logfunnel
