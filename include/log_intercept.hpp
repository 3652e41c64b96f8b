/**
 * @file log_intercept.hpp
 * @brief Backbone listener that forwards every record of a process into a channel
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "log_types.hpp"
#include "log_errors.hpp"
#include "log_utils.hpp"
#include "log_record.hpp"
#include "log_handler.hpp"
#include "log_backbone.hpp"
#include "log_channel.hpp"

namespace logfunnel
{

/**
 * @brief Global listener feeding an aggregation channel
 *
 * Once installed on a backbone it sees every record that propagates in the
 * process, tags it with the current pid and puts it on its channel. Records
 * already marked handled by an aggregation consumer are ignored, which keeps
 * a sink that is itself observed from feeding its output back in.
 *
 * install() lowers the backbone's minimum dispatch level to the lowest level
 * so loggers that inherit it do not filter anything before this handler runs;
 * uninstall() puts the previous level back.
 *
 * @code
 * auto ch      = std::make_shared<channel>();
 * auto handler = intercept_handler::create(log_level::info, ch);
 * handler->install();
 * ...
 * handler->uninstall();
 * @endcode
 */
class intercept_handler final : public log_handler, public std::enable_shared_from_this<intercept_handler>
{
  public:
    static std::shared_ptr<intercept_handler>
    create(log_level level, std::shared_ptr<channel> output, log_backbone &backbone = log_backbone::global())
    {
        return std::shared_ptr<intercept_handler>(new intercept_handler(level, std::move(output), backbone));
    }

    const std::shared_ptr<channel> &output() const noexcept { return channel_; }

    log_backbone &backbone() const noexcept { return *backbone_; }

    bool installed() const { return backbone_->has_handler(*this); }

    /**
     * @brief Register on the backbone. No-op while already registered.
     */
    void install()
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (backbone_->has_handler(*this)) return;

        old_level_ = backbone_->level();
        backbone_->set_level(LOWEST_LOG_LEVEL);
        backbone_->add_handler(shared_from_this());
    }

    /**
     * @brief Unregister and restore the backbone level saved by install()
     *
     * Repeating it after a successful uninstall does nothing.
     *
     * @throws illegal_state_error if install() never ran
     */
    void uninstall()
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!old_level_) { throw illegal_state_error("Cannot uninstall intercept handler, it was never installed"); }

        if (backbone_->remove_handler(*this)) { backbone_->set_level(*old_level_); }
    }

    /**
     * @brief Forward one record
     *
     * An attached exception is rendered to exception_text and the live
     * exception_ptr is dropped from the record, since it cannot cross the
     * channel.
     */
    void on_record(log_record &record) noexcept
    {
        if (is_handled(record)) return;
        if (!accepts(record.level)) return;

        try
        {
            if (record.exception)
            {
                record.exception_text = render_exception(record.exception);
                record.exception      = nullptr;
            }
        }
        catch (const std::exception &)
        {
            return;
        }

        channel_->put({detail::current_pid(), record});
    }

    static void mark_handled(log_record &record) noexcept { record.handled = true; }

    static bool is_handled(const log_record &record) noexcept { return record.handled; }

    /**
     * @brief Intercept handlers currently registered on a backbone, in installation order
     */
    static std::vector<std::shared_ptr<intercept_handler>> installed_on(const log_backbone &backbone)
    {
        std::vector<std::shared_ptr<intercept_handler>> result;
        for (auto &h : backbone.handlers())
        {
            if (auto ih = std::dynamic_pointer_cast<intercept_handler>(h)) { result.push_back(std::move(ih)); }
        }
        return result;
    }

  protected:
    void emit(log_record &record) override { on_record(record); }

  private:
    intercept_handler(log_level level, std::shared_ptr<channel> output, log_backbone &backbone)
    : log_handler(level), channel_(std::move(output)), backbone_(&backbone)
    {
    }

    std::shared_ptr<channel> channel_;
    log_backbone *backbone_;
    std::optional<log_level> old_level_;
    std::mutex state_mutex_;
};

} // namespace logfunnel
