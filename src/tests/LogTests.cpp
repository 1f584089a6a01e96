// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace talktype;

namespace
{

/// @brief Restores the global logger state when a test ends.
struct LogStateGuard
{
    log::Level level = log::getLevel();

    ~LogStateGuard()
    {
        log::setCallback({});
        log::setLevel(level);
    }
};

} // namespace

TEST_CASE("log callback receives the messages that pass the level filter", "[log]")
{
    auto const guard = LogStateGuard {};
    auto messages = std::vector<std::pair<log::Level, std::string>> {};

    log::setLevel(log::Level::Info);
    log::setCallback([&](log::Level level, std::string_view message) { messages.emplace_back(level, message); });

    log::info("utterance #{} ready", 3);
    log::debug("not shown");
    log::warning("queue full");

    REQUIRE(messages.size() == 2);
    CHECK(messages[0].first == log::Level::Info);
    CHECK(messages[0].second == "utterance #3 ready");
    CHECK(messages[1].first == log::Level::Warning);
    CHECK(messages[1].second == "queue full");
}

TEST_CASE("log callback may log and replace itself", "[log]")
{
    auto const guard = LogStateGuard {};
    auto messages = std::vector<std::string> {};
    auto depth = 0;

    log::setLevel(log::Level::Info);

    SECTION("logging from the callback")
    {
        log::setCallback([&](log::Level, std::string_view message) {
            messages.emplace_back(message);
            if (depth++ == 0)
                log::info("nested");
        });

        log::info("outer");
        CHECK(messages == std::vector<std::string> { "outer", "nested" });
    }

    SECTION("removing the callback from inside it")
    {
        log::setCallback([&](log::Level, std::string_view message) {
            messages.emplace_back(message);
            log::setCallback({});
        });

        log::info("first");
        log::info("second goes to stderr");
        CHECK(messages == std::vector<std::string> { "first" });
    }
}

TEST_CASE("log level names round-trip", "[log]")
{
    for (auto const level: { log::Level::Error, log::Level::Warning, log::Level::Info, log::Level::Debug, log::Level::Trace })
        CHECK(log::levelFromString(log::levelName(level)) == level);

    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("loud") == log::Level::Info);
}
