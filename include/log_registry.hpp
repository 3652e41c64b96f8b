#pragma once

/**
 * @file log_registry.hpp
 * @brief Named logger registry and string based level configuration
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <robin_hood.h>
#include "log_types.hpp"
#include "log_utils.hpp"
#include "log_errors.hpp"
#include "log_handler.hpp"
#include "log_backbone.hpp"
#include "log_logger.hpp"

namespace logfunnel {

/**
 * @brief Registry owning all named loggers of one backbone
 *
 * Loggers are created on first lookup and live as long as the registry, so
 * references returned by get_logger() stay valid.
 *
 * Features:
 * - Thread-safe creation and lookup
 * - Dotted names for related loggers ("net", "net.client") via logger::child()
 * - Runtime level control by name, by wildcard, or from a config string
 *
 * Example names:
 * - "network", "database", "worker"
 * - "subsystem.component" for hierarchical organization
 */
class logger_registry
{
  private:
    log_backbone *backbone_;

    robin_hood::unordered_map<std::string, std::unique_ptr<logger>> loggers_;
    mutable std::shared_mutex mutex_; // Allow concurrent reads

  public:
    explicit logger_registry(log_backbone &backbone = log_backbone::global()) : backbone_(&backbone) {}

    logger_registry(const logger_registry &)            = delete;
    logger_registry &operator=(const logger_registry &) = delete;

    static logger_registry &instance()
    {
        static logger_registry inst;
        return inst;
    }

    log_backbone &backbone() const noexcept { return *backbone_; }

    logger &get_logger(std::string_view name)
    {
        std::string key(name);

        // Try to find existing logger (read lock)
        {
            std::shared_lock lock(mutex_);
            auto it = loggers_.find(key);
            if (it != loggers_.end()) { return *it->second; }
        }

        // Create new logger (write lock)
        std::unique_lock lock(mutex_);
        auto it = loggers_.find(key);
        if (it != loggers_.end()) { return *it->second; }

        auto created = std::make_unique<logger>(key, *backbone_, this);
        auto *ptr    = created.get();
        loggers_.emplace(std::move(key), std::move(created));
        return *ptr;
    }

    /**
     * @brief Get or create a logger and configure it in one go
     *
     * If handlers are given they replace whatever the logger had. Without
     * handlers, a logger that has none gets a null_handler so it counts as
     * configured. The level is always applied.
     */
    logger &get_logger(std::string_view name, log_level level, std::vector<std::shared_ptr<log_handler>> handlers = {})
    {
        auto &lg = get_logger(name);
        if (!handlers.empty()) { lg.set_handlers(std::move(handlers)); }
        else if (!lg.has_handlers()) { lg.add_handler(std::make_shared<null_handler>()); }
        lg.set_level(level);
        return lg;
    }

    bool has_logger(std::string_view name) const
    {
        std::shared_lock lock(mutex_);
        return loggers_.find(std::string(name)) != loggers_.end();
    }

    std::vector<logger *> get_all_loggers() const
    {
        std::shared_lock lock(mutex_);
        std::vector<logger *> result;
        result.reserve(loggers_.size());
        for (auto &[name, lg] : loggers_) { result.push_back(lg.get()); }
        return result;
    }

    /**
     * @brief Set the level of a logger, creating it if needed
     */
    void set_logger_level(std::string_view name, log_level level) { get_logger(name).set_level(level); }

    /**
     * @brief Current own level of a logger, notset if it does not exist
     */
    log_level get_logger_level(std::string_view name) const
    {
        std::shared_lock lock(mutex_);
        auto it = loggers_.find(std::string(name));
        return it != loggers_.end() ? it->second->level() : log_level::notset;
    }

    void set_all_loggers_level(log_level level)
    {
        std::shared_lock lock(mutex_);
        for (auto &[name, lg] : loggers_) { lg->set_level(level); }
    }

    /**
     * @brief Put every logger back to notset so they follow the backbone level
     */
    void reset_all_loggers_level() { set_all_loggers_level(log_level::notset); }

    /**
     * @brief Configure logging levels from a string specification
     * @param config Configuration string
     * @return true if configuration was valid, false otherwise
     *
     * Format examples:
     * - "info" - Backbone level and every existing logger to info
     * - "network=debug,database=warn" - Set specific loggers
     * - "info,network=debug" - Default to info, network to debug
     * - "*=warn,network=debug" - All existing loggers to warn, then network to debug
     *
     * Logger names can include wildcards:
     * - "net*=debug" - All loggers starting with "net"
     * - "*worker=info" - All loggers ending with "worker"
     *
     * Parts are applied left to right; parsing stops at the first invalid part.
     */
    bool configure_from_string(const char *config)
    {
        if (!config) return false;

        std::string config_str(config);
        if (config_str.empty()) return false;

        config_str.erase(std::remove_if(config_str.begin(), config_str.end(), [](unsigned char c) { return std::isspace(c); }),
                         config_str.end());

        size_t pos = 0;
        while (pos < config_str.length())
        {
            size_t comma_pos = config_str.find(',', pos);
            if (comma_pos == std::string::npos) comma_pos = config_str.length();

            std::string part = config_str.substr(pos, comma_pos - pos);
            pos              = comma_pos + 1;

            if (part.empty()) continue;

            size_t eq_pos = part.find('=');
            if (eq_pos == std::string::npos)
            {
                // No equals sign - global level
                if (!is_log_level_name(part.c_str())) return false;
                log_level level = log_level_from_string(part.c_str());
                if (level == log_level::notset) return false; // the backbone needs a real level
                backbone_->set_level(level);
                set_all_loggers_level(level);
            }
            else
            {
                std::string pattern   = part.substr(0, eq_pos);
                std::string level_str = part.substr(eq_pos + 1);

                if (pattern.empty() || level_str.empty()) return false;
                if (!is_log_level_name(level_str.c_str())) return false;

                log_level level = log_level_from_string(level_str.c_str());

                if (pattern == "*") { set_all_loggers_level(level); }
                else if (pattern.find('*') != std::string::npos)
                {
                    for (auto *lg : get_all_loggers())
                    {
                        if (detail::wildcard_match(lg->name(), pattern)) { lg->set_level(level); }
                    }
                }
                else { set_logger_level(pattern, level); }
            }
        }

        return true;
    }

    /**
     * @brief Apply configure_from_string() to an environment variable
     * @return false if the variable is unset or invalid
     */
    bool configure_from_env(const char *variable = "LOGFUNNEL_LEVEL")
    {
        const char *value = std::getenv(variable);
        if (!value) return false;
        return configure_from_string(value);
    }
};

inline logger &logger::child(std::string_view suffix) const
{
    if (!registry_) { throw illegal_state_error("Logger '" + name_ + "' is not owned by a registry"); }

    std::string child_name;
    child_name.reserve(name_.size() + 1 + suffix.size());
    child_name.append(name_).append(".").append(suffix);
    return registry_->get_logger(child_name);
}

/**
 * @brief Logger from the global registry
 */
inline logger &get_logger(std::string_view name) { return logger_registry::instance().get_logger(name); }

inline logger &get_logger(std::string_view name, log_level level, std::vector<std::shared_ptr<log_handler>> handlers = {})
{
    return logger_registry::instance().get_logger(name, level, std::move(handlers));
}

} // namespace logfunnel
