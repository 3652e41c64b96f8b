/**
 * @file log_record.hpp
 * @brief A single emitted log event and helpers to render attached exceptions
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <vector>
#include <cxxabi.h>
#include <sys/types.h>

#include "log_types.hpp"
#include "log_utils.hpp"

namespace logfunnel
{

/**
 * @brief One log event
 *
 * Created at the call site, carried through handlers by reference. The
 * aggregation consumer rewrites message and sets handled in place, the
 * intercept handler replaces exception by exception_text before the record
 * leaves the process.
 */
struct log_record
{
    using attribute = std::pair<std::string, std::string>;

    std::string logger_name;
    log_level level{log_level::info};
    std::string message;

    std::exception_ptr exception;   ///< Live exception, never crosses a process boundary
    std::string exception_text;     ///< Rendered form of exception

    std::vector<attribute> attributes; ///< Insertion ordered key/value pairs

    std::chrono::system_clock::time_point timestamp{};
    uint64_t thread_id{0};

    bool handled{false}; ///< Already passed through an aggregation consumer

    log_record() = default;

    log_record(std::string name, log_level lvl, std::string msg)
    : logger_name(std::move(name)),
      level(lvl),
      message(std::move(msg)),
      timestamp(std::chrono::system_clock::now()),
      thread_id(detail::current_thread_id())
    {
    }

    bool has_exception() const noexcept { return exception != nullptr || !exception_text.empty(); }

    /**
     * @brief Set an attribute, replacing an existing value for the same key
     */
    log_record &set_attribute(std::string key, std::string value)
    {
        for (auto &kv : attributes)
        {
            if (kv.first == key)
            {
                kv.second = std::move(value);
                return *this;
            }
        }
        attributes.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    const std::string *find_attribute(std::string_view key) const noexcept
    {
        for (const auto &kv : attributes)
        {
            if (kv.first == key) return &kv.second;
        }
        return nullptr;
    }
};

/**
 * @brief A record paired with the id of the process that emitted it
 */
struct tagged_record
{
    pid_t origin_pid{0};
    log_record record;
};

namespace detail
{

inline std::string demangle(const char *name)
{
    int status = 0;
    std::unique_ptr<char, void (*)(void *)> demangled(abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
    return (status == 0 && demangled) ? std::string(demangled.get()) : std::string(name);
}

inline void render_exception_into(std::string &out, const std::exception_ptr &ptr, int depth)
{
    if (depth > 0) out += "\nCaused by: ";

    try
    {
        std::rethrow_exception(ptr);
    }
    catch (const std::exception &e)
    {
        out += fmt::format("{}: {}", demangle(typeid(e).name()), e.what());
        try
        {
            std::rethrow_if_nested(e);
        }
        catch (...)
        {
            render_exception_into(out, std::current_exception(), depth + 1);
        }
    }
    catch (...)
    {
        out += "unknown exception";
    }
}

} // namespace detail

/**
 * @brief Render an exception and its std::nested_exception chain to text
 *
 * Produces "<type>: <what>" for the outermost exception followed by one
 * "Caused by: <type>: <what>" line per nested level. Non std::exception
 * payloads render as "unknown exception".
 */
inline std::string render_exception(const std::exception_ptr &ptr)
{
    if (!ptr) return {};

    std::string out;
    detail::render_exception_into(out, ptr, 0);
    return out;
}

} // namespace logfunnel
