/**
 * @file log_version.hpp
 * @brief Version information for the logfunnel library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace logfunnel
{

#ifndef LOGFUNNEL_VERSION_STRING
    #define LOGFUNNEL_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = LOGFUNNEL_VERSION_STRING;

} // namespace logfunnel
