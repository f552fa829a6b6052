// SPDX-License-Identifier: Apache-2.0
#include <engine/WhisperEngine.hpp>

#include <catch2/catch_test_macros.hpp>

#include <type_traits>
#include <vector>

using namespace scribe;

TEST_CASE("WhisperEngine::fromFile fails for a missing model", "[whisper]")
{
    auto const engine = WhisperEngine::fromFile("/nonexistent/ggml-model.bin");
    REQUIRE(!engine.has_value());
    CHECK(engine.error().code == ErrorCode::EngineInitFailed);
}

TEST_CASE("WhisperEngine::fromBuffer fails for an empty buffer", "[whisper]")
{
    auto const engine = WhisperEngine::fromBuffer({});
    REQUIRE(!engine.has_value());
    CHECK(engine.error().code == ErrorCode::EngineInitFailed);
}

TEST_CASE("WhisperEngine::fromBuffer fails for data that is not a model", "[whisper]")
{
    auto const garbage = std::vector<std::byte>(256, std::byte { 0x5a });
    auto const engine = WhisperEngine::fromBuffer(garbage, EngineOptions { .useGpu = false });
    REQUIRE(!engine.has_value());
    CHECK(engine.error().code == ErrorCode::EngineInitFailed);
}

TEST_CASE("WhisperEngine is owned only through unique_ptr", "[whisper]")
{
    STATIC_CHECK(!std::is_copy_constructible_v<WhisperEngine>);
    STATIC_CHECK(!std::is_move_constructible_v<WhisperEngine>);
    STATIC_CHECK(!std::is_move_assignable_v<WhisperEngine>);
    STATIC_CHECK(std::is_move_constructible_v<std::unique_ptr<WhisperEngine>>);
}
