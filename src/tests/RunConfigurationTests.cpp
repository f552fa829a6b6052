// SPDX-License-Identifier: Apache-2.0
#include <engine/RunConfiguration.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace scribe;

TEST_CASE("RunConfiguration has expected defaults", "[run-config]")
{
    auto const config = RunConfiguration {};
    CHECK(config.strategy == SamplingStrategy::Greedy);
    CHECK(config.threads >= 1);
    CHECK(config.threads <= 4);
    CHECK(config.language == "en");
    CHECK(config.noContext);
    CHECK(!config.translate);
    CHECK(config.suppressBlank);
    CHECK(config.newSegmentCallback == nullptr);
    CHECK(config.newSegmentCallbackUserData == nullptr);
}

TEST_CASE("runConfigurationFromJson reads known keys", "[run-config]")
{
    auto const input = nlohmann::json {
        { "strategy", "beam-search" },
        { "threads", 8 },
        { "language", "de" },
        { "translate", true },
        { "initialPrompt", "Glossary: whisper, ggml." },
        { "temperature", 0.25 },
        { "beamSize", 3 },
        { "maxSegmentLength", 40 },
        { "splitOnWord", true },
        { "somethingElse", 42 },
    };

    auto const result = runConfigurationFromJson(input);
    REQUIRE(result.has_value());

    CHECK(result->strategy == SamplingStrategy::BeamSearch);
    CHECK(result->threads == 8);
    CHECK(result->language == "de");
    CHECK(result->translate);
    CHECK(result->initialPrompt == "Glossary: whisper, ggml.");
    CHECK(result->temperature == 0.25f);
    CHECK(result->beamSize == 3);
    CHECK(result->maxSegmentLength == 40);
    CHECK(result->splitOnWord);

    SECTION("unspecified keys keep their defaults")
    {
        CHECK(result->noContext);
        CHECK(result->greedyBestOf == 5);
        CHECK(result->noSpeechThreshold == 0.6f);
    }
}

TEST_CASE("runConfigurationFromJson accepts null as all defaults", "[run-config]")
{
    auto const result = runConfigurationFromJson(nlohmann::json {});
    REQUIRE(result.has_value());
    CHECK(result->language == "en");
}

TEST_CASE("runConfigurationFromJson rejects invalid values", "[run-config]")
{
    SECTION("unknown strategy")
    {
        auto const result = runConfigurationFromJson(nlohmann::json { { "strategy", "random" } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("non-positive thread count")
    {
        auto const result = runConfigurationFromJson(nlohmann::json { { "threads", 0 } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("not an object")
    {
        auto const result = runConfigurationFromJson(nlohmann::json::array({ 1, 2 }));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("toJson output is accepted by runConfigurationFromJson", "[run-config]")
{
    auto config = RunConfiguration {};
    config.strategy = SamplingStrategy::BeamSearch;
    config.language = "ja";
    config.tokenTimestamps = true;
    config.offsetMs = 2500;

    auto const json = toJson(config);
    CHECK(json["strategy"] == "beam-search");
    CHECK(!json.contains("newSegmentCallback"));

    auto const parsed = runConfigurationFromJson(json);
    REQUIRE(parsed.has_value());
    CHECK(parsed->strategy == SamplingStrategy::BeamSearch);
    CHECK(parsed->language == "ja");
    CHECK(parsed->tokenTimestamps);
    CHECK(parsed->offsetMs == 2500);
}
