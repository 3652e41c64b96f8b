/**
 * @file log_utils.hpp
 * @brief Common utilities for the logfunnel library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <sys/types.h>
#include <unistd.h>

namespace logfunnel
{

namespace detail
{

/**
 * @brief Simple wildcard pattern matching utility
 *
 * Supports patterns with * at the beginning and/or end:
 * - "prefix*" matches strings starting with "prefix"
 * - "*suffix" matches strings ending with "suffix"
 * - "*infix*" matches strings containing "infix"
 * - "exact" matches only "exact"
 *
 * @param text The text to match against
 * @param pattern The pattern with optional wildcards
 * @return true if the text matches the pattern
 */
inline bool wildcard_match(const std::string &text, const std::string &pattern)
{
    if (pattern.empty()) return text.empty();

    bool starts_with = (pattern.back() == '*');
    bool ends_with   = (pattern.front() == '*');

    std::string literal = pattern;
    if (starts_with) literal.pop_back();
    if (ends_with && !literal.empty()) literal.erase(0, 1);

    if (literal.empty()) return true; // "*" matches everything

    if (starts_with && ends_with) { return text.find(literal) != std::string::npos; }
    else if (starts_with) { return text.compare(0, literal.length(), literal) == 0; }
    else if (ends_with)
    {
        return text.length() >= literal.length() &&
               text.compare(text.length() - literal.length(), literal.length(), literal) == 0;
    }
    return text == literal;
}

/**
 * @brief Process id of the caller, re-read on every call so forked children see their own
 */
inline pid_t current_pid() noexcept { return ::getpid(); }

/**
 * @brief Stable numeric id of the calling thread for record attribution
 */
inline uint64_t current_thread_id() noexcept
{
    return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
}

inline bool is_utf8_continuation(unsigned char c) noexcept { return (c & 0xC0) == 0x80; }

/**
 * @brief Length of the well-formed UTF-8 sequence starting at s[pos], 0 if it is not one
 *
 * Rejects stray continuation bytes, truncated sequences, overlong forms,
 * surrogates and code points above U+10FFFF.
 */
inline size_t utf8_sequence_length(std::string_view s, size_t pos) noexcept
{
    auto c = static_cast<unsigned char>(s[pos]);
    if (c < 0x80) return 1;

    size_t len;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) { len = 2; }
    else if (c >= 0xE0 && c <= 0xEF)
    {
        len = 3;
        if (c == 0xE0) lo = 0xA0;
        if (c == 0xED) hi = 0x9F;
    }
    else if (c >= 0xF0 && c <= 0xF4)
    {
        len = 4;
        if (c == 0xF0) lo = 0x90;
        if (c == 0xF4) hi = 0x8F;
    }
    else return 0;

    if (pos + len > s.size()) return 0;

    auto second = static_cast<unsigned char>(s[pos + 1]);
    if (second < lo || second > hi) return 0;
    for (size_t i = 2; i < len; ++i)
    {
        if (!is_utf8_continuation(static_cast<unsigned char>(s[pos + i]))) return 0;
    }
    return len;
}

/**
 * @brief Copy of s with every ill-formed byte replaced by U+FFFD
 */
inline std::string to_valid_utf8(std::string_view s)
{
    std::string out;
    out.reserve(s.size());

    for (size_t pos = 0; pos < s.size();)
    {
        size_t len = utf8_sequence_length(s, pos);
        if (len == 0)
        {
            out += "\xEF\xBF\xBD";
            ++pos;
            continue;
        }
        out.append(s.data() + pos, len);
        pos += len;
    }
    return out;
}

} // namespace detail

} // namespace logfunnel
