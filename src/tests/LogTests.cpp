// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace scribe;

TEST_CASE("log routes messages at or below the level to the callback", "[log]")
{
    auto received = std::vector<std::pair<log::Level, std::string>> {};
    log::setCallback([&received](log::Level level, std::string_view message) {
        received.emplace_back(level, std::string(message));
    });
    log::setLevel(log::Level::Info);

    log::info("loaded {} segments", 3);
    log::debug("hidden");
    log::error("failed: {}", "boom");

    log::setCallback({});

    REQUIRE(received.size() == 2);
    CHECK(received[0].first == log::Level::Info);
    CHECK(received[0].second == "loaded 3 segments");
    CHECK(received[1].first == log::Level::Error);
    CHECK(received[1].second == "failed: boom");
}

TEST_CASE("log callback may log from inside the sink", "[log]")
{
    auto received = std::vector<std::string> {};
    auto nested = false;
    log::setCallback([&](log::Level /*level*/, std::string_view message) {
        received.emplace_back(message);
        if (!nested)
        {
            nested = true;
            log::warning("sink saw: {}", message);
        }
    });
    log::setLevel(log::Level::Info);

    log::info("outer");

    log::setCallback({});

    REQUIRE(received.size() == 2);
    CHECK(received[0] == "outer");
    CHECK(received[1] == "sink saw: outer");
}

TEST_CASE("levelFromString parses level names", "[log]")
{
    CHECK(log::levelFromString("error") == log::Level::Error);
    CHECK(log::levelFromString("warning") == log::Level::Warning);
    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("info") == log::Level::Info);
    CHECK(log::levelFromString("debug") == log::Level::Debug);
    CHECK(log::levelFromString("trace") == log::Level::Trace);
    CHECK(!log::levelFromString("verbose").has_value());

    for (auto const level: { log::Level::Error, log::Level::Warning, log::Level::Info, log::Level::Debug })
        CHECK(log::levelFromString(log::levelName(level)) == level);
}
