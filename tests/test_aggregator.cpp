/**
 * @file test_aggregator.cpp
 * @brief Aggregation sessions: attribution, echo suppression, workers and lifecycle
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include <unistd.h>

#include "log.hpp"
#include "test_support.hpp"

using namespace logfunnel;
using namespace logfunnel::test;
using namespace Catch::Matchers;

namespace
{

struct aggregation_fixture {
    isolated_logging world;
    std::shared_ptr<capture_handler> capture = std::make_shared<capture_handler>();
    logger &sink = world.registry.get_logger("S", log_level::info, {capture});
};

// Aggregator whose consumer thread can never be started
class unlaunchable_aggregator final : public log_aggregator {
public:
    using log_aggregator::log_aggregator;

protected:
    std::thread launch_consumer(std::shared_ptr<channel>) override {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again), "thread");
    }
};

} // namespace

TEST_CASE("Local records are attributed to the sink", "[aggregator]") {
    aggregation_fixture f;
    log_aggregator aggregator(f.sink, f.world.backbone, f.world.processes);

    REQUIRE(aggregator.start());
    REQUIRE(aggregator.started());
    REQUIRE(aggregator.creating_pid() == ::getpid());

    f.world.registry.get_logger("X").info("hello");
    aggregator.stop();

    REQUIRE(f.capture->messages() == std::vector<std::string>{"[S] - hello"});
    auto entry = f.capture->entries()[0];
    REQUIRE(entry.logger_name == "X");
    REQUIRE(entry.level == log_level::info);
    REQUIRE(entry.handled);
    REQUIRE(aggregator.stats().forwarded == 1);
}

TEST_CASE("The sink's own records are not echoed", "[aggregator]") {
    aggregation_fixture f;
    log_aggregator aggregator(f.sink, f.world.backbone, f.world.processes);
    aggregator.start();

    f.sink.warn("direct");
    aggregator.stop();

    REQUIRE(f.capture->messages() == std::vector<std::string>{"direct"});
    REQUIRE(aggregator.stats().echoes == 1);
    REQUIRE(aggregator.stats().forwarded == 0);
}

TEST_CASE("Records below the sink level are dropped", "[aggregator]") {
    aggregation_fixture f;
    log_aggregator aggregator(f.sink, f.world.backbone, f.world.processes);
    aggregator.start();

    auto &lg = f.world.registry.get_logger("X");

    SECTION("Fixed level") {
        lg.debug("quiet");
        lg.info("loud");
        aggregator.stop();

        REQUIRE(f.capture->messages() == std::vector<std::string>{"[S] - loud"});
    }

    SECTION("Raising the sink level during a session") {
        f.sink.set_level(log_level::error);
        lg.warn("now too quiet");
        lg.error("still loud");
        aggregator.stop();

        REQUIRE(f.capture->messages() == std::vector<std::string>{"[S] - still loud"});
        REQUIRE(aggregator.stats().below_level == 1);
    }
}

TEST_CASE("Records from several producers keep their own order", "[aggregator][threading]") {
    aggregation_fixture f;
    log_aggregator aggregator(f.sink, f.world.backbone, f.world.processes);
    aggregator.start();

    const int num_threads = 4;
    const int per_thread  = 20;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t] {
            auto &lg = f.world.registry.get_logger("T" + std::to_string(t));
            for (int i = 0; i < per_thread; ++i) lg.info("{}", i);
        });
    }
    for (auto &t : threads) t.join();
    aggregator.stop();

    auto entries = f.capture->entries();
    REQUIRE(entries.size() == num_threads * per_thread);

    std::vector<int> next(num_threads, 0);
    for (const auto &e : entries) {
        int t = std::stoi(e.logger_name.substr(1));
        REQUIRE(e.message == "[S] - " + std::to_string(next[t]));
        next[t]++;
    }
}

TEST_CASE("Worker records carry the worker pid", "[aggregator][process]") {
    aggregation_fixture f;
    log_aggregator aggregator(f.sink, f.world.backbone, f.world.processes);
    aggregator.start();

    auto &registry = f.world.registry;

    SECTION("Two workers") {
        auto first  = f.world.processes.create([&registry] { registry.get_logger("job").info("one"); });
        auto second = f.world.processes.create([&registry] { registry.get_logger("job").info("two"); });
        first->start();
        second->start();
        REQUIRE(first->join() == 0);
        REQUIRE(second->join() == 0);
        aggregator.stop();

        REQUIRE(f.capture->count() == 2);
        REQUIRE(f.capture->contains(fmt::format("[S PID {}] - one", first->pid())));
        REQUIRE(f.capture->contains(fmt::format("[S PID {}] - two", second->pid())));
    }

    SECTION("The sink logger inside a worker is attributed") {
        auto worker = f.world.processes.create([&f] { f.sink.info("from worker"); });
        worker->start();
        REQUIRE(worker->join() == 0);
        aggregator.stop();

        REQUIRE(f.capture->messages() == std::vector<std::string>{fmt::format("[S PID {}] - from worker", worker->pid())});
    }

    SECTION("Nested workers") {
        auto &processes = f.world.processes;
        auto outer      = processes.create([&registry, &processes] {
            auto inner = processes.create([&registry] { registry.get_logger("inner").info("deep {}", ::getpid()); });
            inner->start();
            return inner->join();
        });
        outer->start();
        REQUIRE(outer->join() == 0);
        aggregator.stop();

        REQUIRE(f.capture->count() == 1);
        std::smatch match;
        auto message = f.capture->messages()[0];
        REQUIRE(std::regex_match(message, match, std::regex(R"(\[S PID (\d+)\] - deep (\d+))")));
        REQUIRE(match[1].str() == match[2].str());
        REQUIRE(std::stoi(match[1].str()) != outer->pid());
    }

    SECTION("Worker exceptions arrive as text") {
        auto worker = f.world.processes.create([&registry] {
            try {
                throw std::out_of_range("index 7");
            } catch (...) {
                registry.get_logger("job").log_exception(log_level::error, std::current_exception(), "lookup failed");
            }
        });
        worker->start();
        REQUIRE(worker->join() == 0);
        aggregator.stop();

        auto entries = f.capture->entries();
        REQUIRE(entries.size() == 1);
        REQUIRE_THAT(entries[0].message, EndsWith("] - lookup failed"));
        REQUIRE_THAT(entries[0].exception_text, ContainsSubstring("index 7"));
    }

    SECTION("A failing worker is reported through the sink") {
        auto worker = f.world.processes.create([]() -> int { throw std::runtime_error("job crashed"); });
        worker->start();
        REQUIRE(worker->join() == 1);
        aggregator.stop();

        auto entries = f.capture->entries();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].logger_name == "logfunnel.process");
        REQUIRE_THAT(entries[0].message, StartsWith(fmt::format("[S PID {}] - ", worker->pid())));
        REQUIRE_THAT(entries[0].exception_text, ContainsSubstring("job crashed"));
    }
}

TEST_CASE("Session lifecycle", "[aggregator]") {
    aggregation_fixture f;
    f.world.backbone.set_level(log_level::warn);
    auto original_factory = f.world.processes.factory();

    log_aggregator aggregator(f.sink, f.world.backbone, f.world.processes);

    SECTION("Start installs, stop restores") {
        aggregator.start();
        REQUIRE(f.world.backbone.level() == LOWEST_LOG_LEVEL);
        REQUIRE(intercept_handler::installed_on(f.world.backbone).size() == 1);
        REQUIRE(f.world.processes.factory() != original_factory);

        aggregator.stop();
        REQUIRE_FALSE(aggregator.started());
        REQUIRE(f.world.backbone.level() == log_level::warn);
        REQUIRE(f.world.backbone.handlers().empty());
        REQUIRE(f.world.processes.factory() == original_factory);
    }

    SECTION("Start twice and stop twice") {
        REQUIRE(aggregator.start());
        REQUIRE(aggregator.start());
        REQUIRE(intercept_handler::installed_on(f.world.backbone).size() == 1);

        aggregator.stop();
        REQUIRE_NOTHROW(aggregator.stop());
        REQUIRE(f.world.backbone.level() == log_level::warn);
    }

    SECTION("Stop without start") {
        REQUIRE_NOTHROW(aggregator.stop());
        REQUIRE(f.world.processes.factory() == original_factory);
    }

    SECTION("Restart after stop") {
        aggregator.start();
        f.world.registry.get_logger("X").error("first");
        aggregator.stop();

        f.world.registry.get_logger("X").error("between");

        aggregator.start();
        f.world.registry.get_logger("X").error("second");
        aggregator.stop();

        REQUIRE(f.capture->messages() == std::vector<std::string>{"[S] - first", "[S] - second"});
        REQUIRE(aggregator.stats().forwarded == 2);
    }

    SECTION("Destructor stops a running session") {
        {
            log_aggregator scoped(f.sink, f.world.backbone, f.world.processes);
            scoped.start();
            f.world.registry.get_logger("X").error("flushed");
        }
        REQUIRE(f.capture->messages() == std::vector<std::string>{"[S] - flushed"});
        REQUIRE(f.world.backbone.handlers().empty());
    }
}

TEST_CASE("Consumer launch failure rolls the session back", "[aggregator]") {
    aggregation_fixture f;
    f.world.backbone.set_level(log_level::warn);
    auto original_factory = f.world.processes.factory();

    unlaunchable_aggregator aggregator(f.sink, f.world.backbone, f.world.processes);

    REQUIRE_FALSE(aggregator.start());
    REQUIRE_FALSE(aggregator.started());
    REQUIRE(f.world.backbone.level() == log_level::warn);
    REQUIRE(f.world.backbone.handlers().empty());
    REQUIRE(f.world.processes.factory() == original_factory);
    REQUIRE_NOTHROW(aggregator.stop());
}

TEST_CASE("Scoped aggregation", "[aggregator]") {
    aggregation_fixture f;
    log_aggregator aggregator(f.sink, f.world.backbone, f.world.processes);

    SECTION("Normal exit") {
        {
            scoped_aggregation session(aggregator);
            REQUIRE(session.started());
            f.world.registry.get_logger("X").info("inside");
        }
        REQUIRE_FALSE(aggregator.started());
        REQUIRE(f.capture->messages() == std::vector<std::string>{"[S] - inside"});
    }

    SECTION("Exception exit") {
        auto run = [&] {
            scoped_aggregation session(aggregator);
            f.world.registry.get_logger("X").info("before failure");
            throw std::runtime_error("job failed");
        };
        REQUIRE_THROWS_AS(run(), std::runtime_error);
        REQUIRE_FALSE(aggregator.started());
        REQUIRE(f.world.backbone.handlers().empty());
        REQUIRE(f.capture->messages() == std::vector<std::string>{"[S] - before failure"});
    }
}

TEST_CASE("Nested sessions", "[aggregator][nested]") {
    isolated_logging world;
    auto outer_capture = std::make_shared<capture_handler>();
    auto inner_capture = std::make_shared<capture_handler>();
    auto &outer_sink   = world.registry.get_logger("O", log_level::info, {outer_capture});
    auto &inner_sink   = world.registry.get_logger("I", log_level::info, {inner_capture});

    log_aggregator outer(outer_sink, world.backbone, world.processes);
    log_aggregator inner(inner_sink, world.backbone, world.processes);

    SECTION("Local records") {
        auto &lg = world.registry.get_logger("X");

        outer.start();
        lg.info("one");
        inner.start();
        lg.info("two");
        inner.stop();
        lg.info("three");
        outer.stop();

        REQUIRE(inner_capture->messages() == std::vector<std::string>{"[I] - two"});
        REQUIRE(outer_capture->messages() == std::vector<std::string>{"[O] - one", "[O] - two", "[O] - three"});
    }

    SECTION("Worker records") {
        auto &registry = world.registry;
        auto run       = [&](const char *message) {
            auto worker = world.processes.create([&registry, message] { registry.get_logger("job").info("{}", message); });
            worker->start();
            REQUIRE(worker->join() == 0);
            return worker->pid();
        };

        outer.start();
        pid_t first = run("first");
        inner.start();
        pid_t second = run("second");
        inner.stop();
        pid_t third = run("third");
        outer.stop();

        REQUIRE(inner_capture->messages() == std::vector<std::string>{fmt::format("[I PID {}] - second", second)});
        REQUIRE(outer_capture->messages() == std::vector<std::string>{
                                                 fmt::format("[O PID {}] - first", first),
                                                 fmt::format("[O PID {}] - second", second),
                                                 fmt::format("[O PID {}] - third", third),
                                             });
    }

    REQUIRE(world.backbone.handlers().empty());
    REQUIRE(world.backbone.level() == DEFAULT_BACKBONE_LEVEL);
}

TEST_CASE("Text that is not UTF-8 still arrives", "[aggregator]") {
    aggregation_fixture f;
    log_aggregator aggregator(f.sink, f.world.backbone, f.world.processes);
    aggregator.start();

    f.world.registry.get_logger("X").info("{}", std::string("caf\xe9"));
    aggregator.stop();

    REQUIRE(f.capture->messages() == std::vector<std::string>{"[S] - caf\xef\xbf\xbd"});
}

TEST_CASE("A worker started after its session ends still runs", "[aggregator][process]") {
    aggregation_fixture f;
    log_aggregator aggregator(f.sink, f.world.backbone, f.world.processes);
    aggregator.start();

    auto &registry = f.world.registry;
    auto worker    = f.world.processes.create([&registry] {
        registry.get_logger("job").info("too late");
        return 0;
    });
    aggregator.stop();

    worker->start();
    REQUIRE(worker->join() == 0);
    REQUIRE(f.capture->count() == 0);
}
