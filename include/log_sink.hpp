/**
 * @file log_sink.hpp
 * @brief Output handler composed of a formatter, a writer and an optional filter
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_handler.hpp"

namespace logfunnel
{

/**
 * @brief Abstract interface for sink operations
 *
 * This interface hides the concrete Formatter/Writer/Filter combination of a
 * sink so sinks of different kinds can live in the same handler list.
 */
struct sink_concept
{
    virtual ~sink_concept() = default;

    // Format the record into out and write it. Returns false if the filter rejected it.
    virtual bool process(const log_record &record, fmt::memory_buffer &out) const = 0;

    virtual std::string target() const = 0;
};

/**
 * @brief Concrete sink model that holds formatter, writer, and optional filter
 */
template <typename Formatter, typename Writer, typename Filter = void>
struct sink_model final : sink_concept
{
    Formatter formatter_;
    Writer writer_;

    // Only include filter member if Filter is not void
    [[no_unique_address]] std::conditional_t<std::is_void_v<Filter>, std::monostate, Filter> filter_;

    template <typename F = Filter>
    sink_model(Formatter f, Writer w)
        requires std::is_void_v<F>
    : formatter_(std::move(f)), writer_(std::move(w))
    {
    }

    template <typename F = Filter>
    sink_model(Formatter f, Writer w, F flt)
        requires(!std::is_void_v<F> && std::is_same_v<F, Filter>)
    : formatter_(std::move(f)), writer_(std::move(w)), filter_(std::move(flt))
    {
    }

    bool process(const log_record &record, fmt::memory_buffer &out) const override
    {
        if constexpr (!std::is_void_v<Filter>)
        {
            if (!filter_.should_process(record)) { return false; }
        }

        out.clear();
        formatter_.format(record, out);
        if (out.size() > 0) { writer_.write(out.data(), out.size()); }
        return true;
    }

    std::string target() const override { return std::string(writer_.target()); }
};

/**
 * @brief Output handler built from a formatter and a writer
 *
 * Emits are serialized by an internal mutex since the same sink may be
 * reached from application threads and an aggregation consumer at once.
 *
 * ## Usage Example:
 * @code
 * // JSON lines to a file, warnings and up only
 * auto sink = std::make_shared<log_sink>(json_formatter{}, file_writer{"app.jsonl"});
 * sink->set_level(log_level::warn);
 * get_logger("app").add_handler(sink);
 * @endcode
 */
class log_sink final : public log_handler
{
    std::unique_ptr<sink_concept> impl_;
    std::mutex write_mutex_;
    fmt::memory_buffer write_buffer_; // Reused formatting buffer, guarded by write_mutex_

  public:
    template <typename Formatter, typename Writer>
    log_sink(Formatter f, Writer w)
    : impl_(std::make_unique<sink_model<Formatter, Writer>>(std::move(f), std::move(w)))
    {
        write_buffer_.reserve(LOG_SINK_BUFFER_SIZE);
    }

    template <typename Formatter, typename Writer, typename Filter>
    log_sink(Formatter f, Writer w, Filter flt)
    : impl_(std::make_unique<sink_model<Formatter, Writer, Filter>>(std::move(f), std::move(w), std::move(flt)))
    {
        write_buffer_.reserve(LOG_SINK_BUFFER_SIZE);
    }

    /**
     * @brief Where this sink writes: a path, "<stdout>", "<stderr>", ...
     */
    std::string target() const { return impl_ ? impl_->target() : std::string(); }

  protected:
    void emit(log_record &record) override
    {
        if (!impl_) return;

        std::lock_guard<std::mutex> lock(write_mutex_);
        impl_->process(record, write_buffer_);
    }
};

} // namespace logfunnel
