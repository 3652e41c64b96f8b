/**
 * @file log_record_codec.hpp
 * @brief JSON encoding of records for the channel wire format and the JSON sink
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <tao/json.hpp>

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_utils.hpp"

namespace logfunnel
{

/**
 * @brief Produce the JSON object describing a record
 *
 * Only plain data is written. A live exception_ptr is rendered to text
 * first since it cannot leave the process. Text fields are made valid UTF-8,
 * ill-formed bytes become U+FFFD, so the output always parses back.
 */
inline tao::json::value record_to_json(const log_record &record)
{
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(record.timestamp.time_since_epoch()).count();

    tao::json::value out = {
        {"name", detail::to_valid_utf8(record.logger_name)},
        {"level", static_cast<std::int64_t>(record.level)},
        {"msg", detail::to_valid_utf8(record.message)},
        {"ts", static_cast<std::int64_t>(micros)},
        {"thread", static_cast<std::int64_t>(record.thread_id)},
    };

    auto &object = out.get_object();

    if (record.has_exception())
    {
        object.emplace("exc", detail::to_valid_utf8(record.exception_text.empty() ? render_exception(record.exception) : record.exception_text));
    }

    if (!record.attributes.empty())
    {
        tao::json::value attrs = tao::json::empty_object;
        for (const auto &kv : record.attributes) { attrs.get_object().emplace(detail::to_valid_utf8(kv.first), detail::to_valid_utf8(kv.second)); }
        object.emplace("attrs", std::move(attrs));
    }

    if (record.handled) { object.emplace("handled", true); }

    return out;
}

/**
 * @brief Rebuild a record from record_to_json() output
 * @throws std::exception subclasses from taocpp/json on missing or mistyped fields
 */
inline log_record record_from_json(const tao::json::value &in)
{
    const auto &object = in.get_object();

    log_record record;
    record.logger_name = object.at("name").as<std::string>();
    record.level       = static_cast<log_level>(object.at("level").as<std::int64_t>());
    record.message     = object.at("msg").as<std::string>();
    record.timestamp   = std::chrono::system_clock::time_point(std::chrono::microseconds(object.at("ts").as<std::int64_t>()));
    record.thread_id   = static_cast<uint64_t>(object.at("thread").as<std::int64_t>());

    if (auto it = object.find("exc"); it != object.end()) { record.exception_text = it->second.as<std::string>(); }

    if (auto it = object.find("attrs"); it != object.end())
    {
        for (const auto &[key, value] : it->second.get_object()) { record.attributes.emplace_back(key, value.as<std::string>()); }
    }

    if (auto it = object.find("handled"); it != object.end()) { record.handled = it->second.as<bool>(); }

    return record;
}

/**
 * @brief Wire form of a tagged record: {"pid": <origin>, "rec": {...}}
 */
inline std::string encode_tagged_record(const tagged_record &item)
{
    tao::json::value frame = {
        {"pid", static_cast<std::int64_t>(item.origin_pid)},
        {"rec", record_to_json(item.record)},
    };
    return tao::json::to_string(frame);
}

inline tagged_record decode_tagged_record(std::string_view data)
{
    const auto frame   = tao::json::from_string(data);
    const auto &object = frame.get_object();

    tagged_record item;
    item.origin_pid = static_cast<pid_t>(object.at("pid").as<std::int64_t>());
    item.record     = record_from_json(object.at("rec"));
    return item;
}

} // namespace logfunnel
