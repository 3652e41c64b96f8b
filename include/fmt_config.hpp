/**
 * @file fmt_config.hpp
 * @brief Pulls in fmt in header-only mode
 *
 * logfunnel ships as headers only, so fmt is consumed the same way and
 * nothing has to be linked for message formatting.
 */
#pragma once

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
#include <fmt/chrono.h>
