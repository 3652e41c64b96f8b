/**
 * @file log_formatters.hpp
 * @brief Log record formatting implementations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <ctime>
#include <iterator>
#include <string_view>

#include <tao/json.hpp>

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_record_codec.hpp"

namespace logfunnel
{

/**
 * @brief Human readable line formatter
 *
 * Default output:
 * @code
 * 2025-08-02 08:24:22 worker INFO [S PID 4242] - hello user_id=7
 * @endcode
 *
 * Attributes follow the message as logfmt pairs, an attached exception is
 * printed on the following line(s). Timestamp and level can be switched off,
 * which leaves "<name> <message>".
 */
class text_formatter
{
  public:
    bool use_color      = false;
    bool add_newline    = true;
    bool show_timestamp = true;
    bool show_level     = true;

    void format(const log_record &record, fmt::memory_buffer &out) const
    {
        auto it = std::back_inserter(out);

        if (use_color && is_record_level(record.level))
        {
            fmt::format_to(it, "{}", log_level_colors[static_cast<int>(record.level)]);
        }

        if (show_timestamp)
        {
            std::time_t t = std::chrono::system_clock::to_time_t(record.timestamp);
            std::tm tm{};
            localtime_r(&t, &tm);
            fmt::format_to(it, "{:%Y-%m-%d %H:%M:%S} ", tm);
        }

        fmt::format_to(it, "{} ", record.logger_name);

        if (show_level) { fmt::format_to(it, "{} ", log_level_label(record.level)); }

        fmt::format_to(it, "{}", record.message);

        for (const auto &[key, value] : record.attributes)
        {
            bool needs_quotes = value.empty() || value.find_first_of(" \t\n\r\"'") != std::string::npos;
            if (needs_quotes) { fmt::format_to(it, " {}=\"{}\"", key, value); }
            else { fmt::format_to(it, " {}={}", key, value); }
        }

        if (!record.exception_text.empty()) { fmt::format_to(it, "\n{}", record.exception_text); }
        else if (record.exception) { fmt::format_to(it, "\n{}", render_exception(record.exception)); }

        if (use_color) { fmt::format_to(it, "\033[0m"); }

        if (add_newline) { out.push_back('\n'); }
    }
};

/**
 * @brief JSON formatter using taocpp/json
 *
 * One object per record, the same shape the channel uses on the wire plus a
 * readable level name.
 *
 * Usage:
 * @code
 * json_formatter formatter{.pretty_print = true};
 * @endcode
 */
class json_formatter
{
  public:
    bool pretty_print = false;
    bool add_newline  = true;

    void format(const log_record &record, fmt::memory_buffer &out) const
    {
        auto value = record_to_json(record);
        value.get_object().emplace("level_name", string_from_log_level(record.level));

        std::string text = pretty_print ? tao::json::to_string(value, 2) : tao::json::to_string(value);
        out.append(text.data(), text.data() + text.size());

        if (add_newline) { out.push_back('\n'); }
    }
};

} // namespace logfunnel
