/**
 * @file test_channel.cpp
 * @brief Channel transport: ordering, close-then-drain, drops and cross-process producers
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

#include "log.hpp"
#include "test_support.hpp"

using namespace logfunnel;
using namespace logfunnel::test;
using namespace Catch::Matchers;

namespace
{

tagged_record make_item(const std::string &message, pid_t pid = ::getpid()) {
    return {pid, log_record("chan", log_level::info, message)};
}

std::vector<tagged_record> drain(channel &ch) {
    std::vector<tagged_record> result;
    for (auto &item : ch.records()) result.push_back(item);
    return result;
}

} // namespace

TEST_CASE("Channel delivers in order and ends after close", "[channel]") {
    channel ch;
    REQUIRE(ch.owner());
    REQUIRE_FALSE(ch.closed());

    REQUIRE(ch.put(make_item("one")));
    REQUIRE(ch.put(make_item("two")));
    REQUIRE(ch.put(make_item("three")));
    ch.close();

    auto items = drain(ch);
    REQUIRE(items.size() == 3);
    REQUIRE(items[0].record.message == "one");
    REQUIRE(items[1].record.message == "two");
    REQUIRE(items[2].record.message == "three");
    REQUIRE(items[0].origin_pid == ::getpid());

    auto stats = ch.stats();
    REQUIRE(stats.put == 3);
    REQUIRE(stats.received == 3);
    REQUIRE(stats.dropped == 0);
}

TEST_CASE("Channel close semantics", "[channel]") {
    channel ch;

    SECTION("Puts after close are dropped and counted") {
        REQUIRE(ch.put(make_item("before")));
        ch.close();
        REQUIRE_FALSE(ch.put(make_item("after")));
        REQUIRE(ch.closed());
        REQUIRE(ch.stats().dropped == 1);

        auto items = drain(ch);
        REQUIRE(items.size() == 1);
        REQUIRE(items[0].record.message == "before");
    }

    SECTION("Close is idempotent") {
        ch.close();
        REQUIRE_NOTHROW(ch.close());
        REQUIRE(drain(ch).empty());
    }

    SECTION("The sequence is single pass") {
        REQUIRE(ch.put(make_item("only")));
        ch.close();
        REQUIRE(drain(ch).size() == 1);
        REQUIRE(drain(ch).empty());

        tagged_record out;
        REQUIRE_FALSE(ch.receive(out));
    }
}

TEST_CASE("Consumer blocks until records arrive", "[channel][threading]") {
    channel ch;
    std::vector<std::string> received;

    std::thread consumer([&] {
        for (auto &item : ch.records()) received.push_back(item.record.message);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(ch.put(make_item("late")));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
    consumer.join();

    REQUIRE(received == std::vector<std::string>{"late"});
}

TEST_CASE("Many producers keep their own order", "[channel][threading]") {
    channel ch;
    const int num_producers = 4;
    const int per_producer  = 25;

    std::vector<tagged_record> received;
    std::thread consumer([&] { received = drain(ch); });

    std::vector<std::thread> producers;
    for (int p = 0; p < num_producers; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < per_producer; ++i) {
                auto item = make_item(std::to_string(i));
                item.record.set_attribute("producer", std::to_string(p));
                ch.put(item);
            }
        });
    }
    for (auto &t : producers) t.join();
    ch.close();
    consumer.join();

    REQUIRE(received.size() == num_producers * per_producer);

    std::map<std::string, int> next;
    for (const auto &item : received) {
        auto producer = *item.record.find_attribute("producer");
        REQUIRE(std::stoi(item.record.message) == next[producer]);
        next[producer]++;
    }
}

TEST_CASE("Forked producers share the channel", "[channel][process]") {
    channel ch;
    auto handle = ch.handle();
    REQUIRE(handle.valid());

    std::vector<pid_t> children;
    for (int c = 0; c < 2; ++c) {
        pid_t pid = ::fork();
        REQUIRE(pid >= 0);
        if (pid == 0) {
            auto endpoint = channel::attach(handle);
            bool ok       = endpoint->put(make_item("from child"));
            ::_exit(ok ? 0 : 3);
        }
        children.push_back(pid);
    }

    for (auto pid : children) {
        int status = 0;
        REQUIRE(::waitpid(pid, &status, 0) == pid);
        REQUIRE(WIFEXITED(status));
        REQUIRE(WEXITSTATUS(status) == 0);
    }

    ch.close();
    auto items = drain(ch);
    REQUIRE(items.size() == 2);
    for (const auto &item : items) {
        REQUIRE(item.record.message == "from child");
        REQUIRE(item.origin_pid != ::getpid());
    }
    REQUIRE(items[0].origin_pid != items[1].origin_pid);
}

TEST_CASE("Attached endpoints", "[channel]") {
    channel ch;
    auto endpoint = channel::attach(ch.handle());

    REQUIRE_FALSE(endpoint->owner());
    REQUIRE(endpoint->put(make_item("via attached")));

    // Closing an attached endpoint stops only that endpoint
    endpoint->close();
    REQUIRE_FALSE(endpoint->put(make_item("dropped")));
    REQUIRE(ch.put(make_item("owner still open")));

    tagged_record out;
    REQUIRE_THROWS_AS(endpoint->receive(out), illegal_state_error);

    // Closing the owner ends the stream for every endpoint
    ch.close();
    REQUIRE_FALSE(endpoint->put(make_item("after owner close")));

    auto items = drain(ch);
    REQUIRE(items.size() == 2);
    REQUIRE(items[0].record.message == "via attached");
    REQUIRE(items[1].record.message == "owner still open");
}

TEST_CASE("Oversized records are truncated to a frame", "[channel]") {
    channel ch;

    SECTION("Long message") {
        auto item = make_item(std::string(MAX_FRAME_SIZE * 2, 'x'));
        REQUIRE(ch.put(item));
        ch.close();

        auto items = drain(ch);
        REQUIRE(items.size() == 1);
        REQUIRE(items[0].record.message.size() < MAX_FRAME_SIZE);
        REQUIRE_THAT(items[0].record.message, EndsWith(TRUNCATION_MARKER));
        REQUIRE(ch.stats().truncated == 1);
    }

    SECTION("Multi-byte characters are not split") {
        std::string text;
        while (text.size() < MAX_FRAME_SIZE + 100) text += "\xc3\xa9";
        REQUIRE(ch.put(make_item(text)));
        ch.close();

        auto items = drain(ch);
        REQUIRE(items.size() == 1);
        auto &msg = items[0].record.message;
        auto body = msg.substr(0, msg.size() - std::string(TRUNCATION_MARKER).size());
        REQUIRE(body.size() % 2 == 0);
    }

    SECTION("Records that cannot shrink enough are dropped") {
        auto item = make_item("small");
        item.record.set_attribute("blob", std::string(MAX_FRAME_SIZE * 2, 'y'));
        REQUIRE_FALSE(ch.put(item));
        REQUIRE(ch.stats().dropped == 1);
        ch.close();
        REQUIRE(drain(ch).empty());
    }
}
