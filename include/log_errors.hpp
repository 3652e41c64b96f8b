/**
 * @file log_errors.hpp
 * @brief Exception types raised by logfunnel
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <stdexcept>

namespace logfunnel
{

/**
 * @brief An operation was called in a state that cannot support it
 *
 * Raised by intercept_handler::uninstall() when there is no prior install
 * whose backbone level could be restored.
 */
class illegal_state_error : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

/**
 * @brief Construction parameters do not describe a usable setup
 *
 * Raised by log_funnel when neither a file nor the console was requested.
 */
class invalid_configuration_error : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

} // namespace logfunnel
