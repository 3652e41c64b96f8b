/**
 * @file test_intercept.cpp
 * @brief Intercept handler install/uninstall and record forwarding
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

#include "log.hpp"
#include "test_support.hpp"

using namespace logfunnel;
using namespace logfunnel::test;
using namespace Catch::Matchers;

namespace
{

std::vector<tagged_record> close_and_drain(channel &ch) {
    ch.close();
    std::vector<tagged_record> result;
    for (auto &item : ch.records()) result.push_back(item);
    return result;
}

} // namespace

TEST_CASE("Install and uninstall", "[intercept]") {
    log_backbone backbone(log_level::warn);
    auto ch      = std::make_shared<channel>();
    auto handler = intercept_handler::create(log_level::info, ch, backbone);

    SECTION("Install lowers the backbone level and registers once") {
        handler->install();
        REQUIRE(handler->installed());
        REQUIRE(backbone.level() == LOWEST_LOG_LEVEL);
        REQUIRE(backbone.handlers().size() == 1);

        handler->install();
        REQUIRE(backbone.handlers().size() == 1);
        REQUIRE(backbone.level() == LOWEST_LOG_LEVEL);

        handler->uninstall();
        REQUIRE_FALSE(handler->installed());
        REQUIRE(backbone.level() == log_level::warn);
        REQUIRE(backbone.handlers().empty());
    }

    SECTION("Uninstall without install is an error") {
        REQUIRE_THROWS_AS(handler->uninstall(), illegal_state_error);
        REQUIRE(backbone.level() == log_level::warn);
    }

    SECTION("Uninstall twice is harmless") {
        handler->install();
        handler->uninstall();
        backbone.set_level(log_level::error);
        REQUIRE_NOTHROW(handler->uninstall());
        REQUIRE(backbone.level() == log_level::error);
    }

    SECTION("Stacked handlers restore levels in reverse order") {
        auto second = intercept_handler::create(log_level::debug, std::make_shared<channel>(), backbone);
        handler->install();
        second->install();
        REQUIRE(intercept_handler::installed_on(backbone).size() == 2);
        REQUIRE(intercept_handler::installed_on(backbone)[0] == handler);
        REQUIRE(intercept_handler::installed_on(backbone)[1] == second);

        second->uninstall();
        REQUIRE(backbone.level() == LOWEST_LOG_LEVEL);
        handler->uninstall();
        REQUIRE(backbone.level() == log_level::warn);
    }

    SECTION("Reinstall after uninstall") {
        handler->install();
        handler->uninstall();
        handler->install();
        REQUIRE(handler->installed());
        handler->uninstall();
        REQUIRE(backbone.level() == log_level::warn);
    }
}

TEST_CASE("Records are forwarded with the origin pid", "[intercept]") {
    log_backbone backbone;
    auto ch      = std::make_shared<channel>();
    auto handler = intercept_handler::create(log_level::info, ch, backbone);
    handler->install();

    logger lg("X", backbone);

    SECTION("Level threshold") {
        lg.debug("below");
        lg.info("at");
        lg.error("above");
        handler->uninstall();

        auto items = close_and_drain(*ch);
        REQUIRE(items.size() == 2);
        REQUIRE(items[0].record.message == "at");
        REQUIRE(items[0].record.logger_name == "X");
        REQUIRE(items[0].origin_pid == ::getpid());
        REQUIRE(items[1].record.level == log_level::error);
    }

    SECTION("Handled records are ignored") {
        auto record = lg.make_record(log_level::error, "already aggregated");
        intercept_handler::mark_handled(record);
        REQUIRE(intercept_handler::is_handled(record));
        lg.handle(record);
        handler->uninstall();

        REQUIRE(close_and_drain(*ch).empty());
    }

    SECTION("Exceptions travel as text") {
        auto record      = lg.make_record(log_level::error, "failed");
        record.exception = std::make_exception_ptr(std::runtime_error("socket closed"));
        handler->on_record(record);
        handler->uninstall();

        // The record itself now carries the text instead of the live exception
        REQUIRE(record.exception == nullptr);
        REQUIRE_THAT(record.exception_text, ContainsSubstring("socket closed"));

        auto items = close_and_drain(*ch);
        REQUIRE(items.size() == 1);
        REQUIRE_THAT(items[0].record.exception_text, ContainsSubstring("std::runtime_error: socket closed"));
    }

    SECTION("A closed channel drops silently") {
        ch->close();
        REQUIRE_NOTHROW(lg.error("nowhere to go"));
        handler->uninstall();
        REQUIRE(ch->stats().dropped == 1);
    }
}
