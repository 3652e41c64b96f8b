/**
 * @file log_process.hpp
 * @brief Forked worker processes and the substitutable factory that creates them
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Workers are created through a process_context, which holds the active
 * process_factory. An aggregation session swaps in intercepting_process_factory
 * for its lifetime, so every worker created meanwhile carries the session's
 * intercept handlers into the child before the worker's target runs.
 *
 * @code
 * auto worker = process_context::instance().create([] { get_logger("job").info("hello"); });
 * worker->start();
 * int code = worker->join();
 * @endcode
 *
 * @warning fork() copies only the calling thread. A mutex held by another
 *          thread at that moment stays locked in the child. start() holds the
 *          backbone's handler lock across fork(); other locks (sinks, the
 *          logger registry) are the caller's concern.
 */
#pragma once

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "fmt_config.hpp" // IWYU pragma: keep

#include "log_types.hpp"
#include "log_errors.hpp"
#include "log_backbone.hpp"
#include "log_logger.hpp"
#include "log_channel.hpp"
#include "log_intercept.hpp"

namespace logfunnel
{

/**
 * @brief A target callable run in a forked child
 *
 * The child runs before_run(), the target and after_run(), then leaves with
 * _exit() and the target's return value. after_run() runs on every path. An
 * exception escaping before_run() or the target is logged at error level on
 * the "logfunnel.process" logger and makes the exit code 1.
 *
 * join() reports a worker killed by a signal as the negated signal number.
 */
class worker_process
{
  public:
    using target_type = std::function<int()>;

    explicit worker_process(target_type target, log_backbone &backbone = log_backbone::global())
    : target_(std::move(target)), backbone_(&backbone)
    {
    }

    virtual ~worker_process()
    {
        if (pid_ <= 0 || exit_code_) return;

        try
        {
            join();
        }
        catch (const std::system_error &e)
        {
            std::fprintf(stderr, "logfunnel: failed to reap worker %d: %s\n", static_cast<int>(pid_), e.what());
        }
    }

    worker_process(const worker_process &)            = delete;
    worker_process &operator=(const worker_process &) = delete;

    /**
     * @brief Fork and run the target in the child
     * @throws illegal_state_error if already started
     * @throws std::system_error if fork() fails
     */
    void start()
    {
        if (pid_ > 0) { throw illegal_state_error("Worker process already started"); }

        // Pending stdio output would otherwise be written again by the child
        std::fflush(nullptr);

        pid_t pid;
        {
            auto guard = backbone_->fork_guard();
            pid        = ::fork();
        }

        if (pid < 0) { throw std::system_error(errno, std::generic_category(), "fork"); }
        if (pid == 0) { bootstrap(); }

        pid_ = pid;
    }

    /**
     * @brief Wait for the worker to finish
     * @return Exit code, or the negated signal number
     * @throws illegal_state_error if never started
     * @throws std::system_error if waitpid() fails
     */
    int join()
    {
        if (pid_ <= 0) { throw illegal_state_error("Worker process was never started"); }
        if (exit_code_) return *exit_code_;

        int status = 0;
        for (;;)
        {
            pid_t r = ::waitpid(pid_, &status, 0);
            if (r == pid_) break;
            if (r < 0 && errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }

        exit_code_ = decode_status(status);
        return *exit_code_;
    }

    bool is_alive()
    {
        if (pid_ <= 0 || exit_code_) return false;

        int status = 0;
        pid_t r    = ::waitpid(pid_, &status, WNOHANG);
        if (r == 0) return true;
        if (r == pid_) { exit_code_ = decode_status(status); }
        return false;
    }

    pid_t pid() const noexcept { return pid_; }

    /**
     * @brief Exit code once join() or is_alive() has seen the worker end
     */
    std::optional<int> exit_code() const noexcept { return exit_code_; }

    log_backbone &backbone() const noexcept { return *backbone_; }

  protected:
    // Hooks run in the child around the target
    virtual void before_run() {}
    virtual void after_run() noexcept {}

  private:
    static int decode_status(int status)
    {
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return -WTERMSIG(status);
        return -1;
    }

    [[noreturn]] void bootstrap() noexcept
    {
        int code = 1;
        try
        {
            before_run();
            code = target_ ? target_() : 0;
        }
        catch (...)
        {
            report_failure(std::current_exception());
            code = 1;
        }

        after_run();

        std::fflush(nullptr);
        ::_exit(code);
    }

    void report_failure(std::exception_ptr error) noexcept
    {
        try
        {
            logger lg("logfunnel.process", *backbone_);
            if (backbone_->handlers().empty())
            {
                std::fprintf(stderr, "logfunnel: worker %d failed: %s\n", static_cast<int>(::getpid()), render_exception(error).c_str());
                return;
            }
            lg.log_exception(log_level::error, std::move(error), "Worker process {} failed", ::getpid());
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "logfunnel: worker %d failed, and reporting it failed: %s\n", static_cast<int>(::getpid()), e.what());
        }
    }

    target_type target_;
    log_backbone *backbone_;
    pid_t pid_{0};
    std::optional<int> exit_code_;
};

/**
 * @brief Strategy creating worker processes
 */
class process_factory
{
  public:
    virtual ~process_factory() = default;

    virtual std::unique_ptr<worker_process> create(worker_process::target_type target) = 0;
};

class default_process_factory final : public process_factory
{
  public:
    explicit default_process_factory(log_backbone &backbone = log_backbone::global()) : backbone_(&backbone) {}

    std::unique_ptr<worker_process> create(worker_process::target_type target) override
    {
        return std::make_unique<worker_process>(std::move(target), *backbone_);
    }

  private:
    log_backbone *backbone_;
};

/**
 * @brief Serializable state of one installed intercept handler
 */
struct handler_snapshot
{
    log_level level;
    channel_handle handle;
    std::shared_ptr<channel> output; ///< Keeps the descriptors open until the worker is gone
};

/**
 * @brief Worker that reinstalls the parent's intercept handlers in the child
 *
 * The snapshot is taken when the worker object is created, in the parent.
 * In the child, before the target runs, the handler objects inherited through
 * fork() are uninstalled and one fresh handler per snapshot entry is installed
 * on an attached channel endpoint. They are uninstalled again after the
 * target, whatever way it ended.
 *
 * A worker started after its session stopped still runs its target. The
 * snapshot keeps the session's channel open, so the child's records meet a
 * shut-down socket and are dropped.
 */
class intercepting_process : public worker_process
{
  public:
    explicit intercepting_process(target_type target, log_backbone &backbone = log_backbone::global())
    : worker_process(std::move(target), backbone)
    {
        for (const auto &h : intercept_handler::installed_on(backbone))
        {
            snapshot_.push_back({h->level(), h->output()->handle(), h->output()});
        }
    }

    const std::vector<handler_snapshot> &snapshot() const noexcept { return snapshot_; }

  protected:
    void before_run() override
    {
        if (snapshot_.empty()) return;

        auto inherited = intercept_handler::installed_on(backbone());
        for (auto it = inherited.rbegin(); it != inherited.rend(); ++it) { (*it)->uninstall(); }

        for (const auto &entry : snapshot_)
        {
            std::shared_ptr<channel> endpoint;
            try
            {
                endpoint = channel::attach(entry.handle);
            }
            catch (const std::runtime_error &e)
            {
                // The target still runs, its records just are not aggregated
                fmt::print(stderr, "logfunnel: worker {} runs without aggregation: {}\n", ::getpid(), e.what());
                continue;
            }

            auto handler = intercept_handler::create(entry.level, std::move(endpoint), backbone());
            handler->install();
            installed_.push_back(std::move(handler));
        }
    }

    void after_run() noexcept override
    {
        for (auto it = installed_.rbegin(); it != installed_.rend(); ++it)
        {
            try
            {
                (*it)->uninstall();
            }
            catch (const std::exception &e)
            {
                std::fprintf(stderr, "logfunnel: failed to uninstall worker intercept handler: %s\n", e.what());
            }
        }
        installed_.clear();
    }

  private:
    std::vector<handler_snapshot> snapshot_;
    std::vector<std::shared_ptr<intercept_handler>> installed_;
};

class intercepting_process_factory final : public process_factory
{
  public:
    explicit intercepting_process_factory(log_backbone &backbone = log_backbone::global()) : backbone_(&backbone) {}

    std::unique_ptr<worker_process> create(worker_process::target_type target) override
    {
        return std::make_unique<intercepting_process>(std::move(target), *backbone_);
    }

  private:
    log_backbone *backbone_;
};

/**
 * @brief Holder of the active process factory
 *
 * Code that wants its workers to take part in aggregation creates them
 * through a context. The global instance is what log_aggregator swaps by
 * default.
 */
class process_context
{
  public:
    explicit process_context(log_backbone &backbone = log_backbone::global())
    : backbone_(&backbone), factory_(std::make_shared<default_process_factory>(backbone))
    {
    }

    process_context(const process_context &)            = delete;
    process_context &operator=(const process_context &) = delete;

    static process_context &instance()
    {
        static process_context inst;
        return inst;
    }

    log_backbone &backbone() const noexcept { return *backbone_; }

    std::shared_ptr<process_factory> factory() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return factory_;
    }

    /**
     * @brief Install a new factory
     * @return The factory it replaced
     */
    std::shared_ptr<process_factory> exchange_factory(std::shared_ptr<process_factory> factory)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::exchange(factory_, std::move(factory));
    }

    /**
     * @brief Create (but not start) a worker running f(args...)
     *
     * A void callable exits with 0, anything else is converted to the exit code.
     */
    template <typename F, typename... Args> std::unique_ptr<worker_process> create(F &&f, Args &&...args)
    {
        auto target = [fn = std::forward<F>(f), ... bound = std::forward<Args>(args)]() mutable -> int {
            if constexpr (std::is_void_v<std::invoke_result_t<std::decay_t<F> &, std::decay_t<Args> &...>>)
            {
                std::invoke(fn, bound...);
                return 0;
            }
            else { return static_cast<int>(std::invoke(fn, bound...)); }
        };

        return factory()->create(std::move(target));
    }

  private:
    log_backbone *backbone_;
    mutable std::mutex mutex_;
    std::shared_ptr<process_factory> factory_;
};

} // namespace logfunnel
