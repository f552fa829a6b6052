// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace scribe
{

class InferenceEngine;

/// @brief C-style callback invoked by the engine when new segments are available.
///
/// This is a plain function pointer on purpose: the engine boundary cannot carry
/// captured state, so the receiver is identified by @p userData only.
/// @param engine The engine that produced the segments.
/// @param newSegmentCount Number of segments added since the previous invocation.
/// @param userData The token stored in RunConfiguration::newSegmentCallbackUserData.
using NewSegmentCallback = void (*)(InferenceEngine& engine, int newSegmentCount, void* userData);

/// @brief Decoding strategy.
enum class SamplingStrategy : std::uint8_t
{
    Greedy,
    BeamSearch,
};

[[nodiscard]] auto samplingStrategyName(SamplingStrategy strategy) -> std::string_view;

/// @brief Tunables for one transcription pass.
///
/// Mirrors whisper_full_params. Field defaults match whisper.cpp's greedy defaults
/// except for noContext, which is enabled so separate runs stay independent.
struct RunConfiguration
{
    SamplingStrategy strategy = SamplingStrategy::Greedy;
    int threads = defaultThreadCount();
    int maxTextContext = 16384;
    int offsetMs = 0;
    int durationMs = 0;

    bool translate = false;
    bool noContext = true;
    bool noTimestamps = false;
    bool singleSegment = false;
    bool printSpecial = false;
    bool printProgress = false;
    bool printRealtime = false;
    bool printTimestamps = false;

    bool tokenTimestamps = false;
    float tokenTimestampThreshold = 0.01f;
    float tokenTimestampSumThreshold = 0.01f;
    int maxSegmentLength = 0;
    bool splitOnWord = false;
    int maxTokens = 0;

    std::string initialPrompt;
    std::string language = "en";
    bool detectLanguage = false;

    bool suppressBlank = true;
    bool suppressNonSpeechTokens = false;

    float temperature = 0.0f;
    float temperatureIncrement = 0.2f;
    float entropyThreshold = 2.4f;
    float logProbThreshold = -1.0f;
    float noSpeechThreshold = 0.6f;

    int greedyBestOf = 5;
    int beamSize = 5;

    /// @brief Installed by TranscriptionSession on its per-run copy; never stored in the session.
    NewSegmentCallback newSegmentCallback = nullptr;
    void* newSegmentCallbackUserData = nullptr;

    /// @brief min(4, hardware concurrency), and at least 1.
    [[nodiscard]] static auto defaultThreadCount() -> int;
};

/// @brief Reads a RunConfiguration from a JSON object.
///
/// Missing keys keep their defaults. Callback slots are never read from JSON.
/// @return The configuration, or ConfigError for an unknown strategy or a non-positive thread count.
[[nodiscard]] auto runConfigurationFromJson(const nlohmann::json& obj) -> Result<RunConfiguration>;

/// @brief Serializes the tunables of @p config (not the callback slots).
[[nodiscard]] auto toJson(const RunConfiguration& config) -> nlohmann::json;

} // namespace scribe
