// SPDX-License-Identifier: Apache-2.0
#include "RunConfiguration.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>
#include <thread>

namespace scribe
{

auto samplingStrategyName(SamplingStrategy strategy) -> std::string_view
{
    switch (strategy)
    {
        case SamplingStrategy::Greedy: return "greedy";
        case SamplingStrategy::BeamSearch: return "beam-search";
    }
    return "greedy";
}

auto RunConfiguration::defaultThreadCount() -> int
{
    auto const hardware = static_cast<int>(std::thread::hardware_concurrency());
    return std::clamp(hardware, 1, 4);
}

auto runConfigurationFromJson(const nlohmann::json& obj) -> Result<RunConfiguration>
{
    auto config = RunConfiguration {};
    if (obj.is_null())
        return config;
    if (!obj.is_object())
        return makeError(ErrorCode::ConfigError, "Run configuration must be a JSON object");

    auto const strategy = json::getStringOr(obj, "strategy", samplingStrategyName(config.strategy));
    if (strategy == "greedy")
        config.strategy = SamplingStrategy::Greedy;
    else if (strategy == "beam-search")
        config.strategy = SamplingStrategy::BeamSearch;
    else
        return makeError(ErrorCode::ConfigError, std::format("Unknown sampling strategy: {}", strategy));

    config.threads = json::getIntOr(obj, "threads", config.threads);
    if (config.threads <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("Thread count must be positive, got {}", config.threads));

    config.maxTextContext = json::getIntOr(obj, "maxTextContext", config.maxTextContext);
    config.offsetMs = json::getIntOr(obj, "offsetMs", config.offsetMs);
    config.durationMs = json::getIntOr(obj, "durationMs", config.durationMs);

    config.translate = json::getBoolOr(obj, "translate", config.translate);
    config.noContext = json::getBoolOr(obj, "noContext", config.noContext);
    config.noTimestamps = json::getBoolOr(obj, "noTimestamps", config.noTimestamps);
    config.singleSegment = json::getBoolOr(obj, "singleSegment", config.singleSegment);
    config.printSpecial = json::getBoolOr(obj, "printSpecial", config.printSpecial);
    config.printProgress = json::getBoolOr(obj, "printProgress", config.printProgress);
    config.printRealtime = json::getBoolOr(obj, "printRealtime", config.printRealtime);
    config.printTimestamps = json::getBoolOr(obj, "printTimestamps", config.printTimestamps);

    config.tokenTimestamps = json::getBoolOr(obj, "tokenTimestamps", config.tokenTimestamps);
    config.tokenTimestampThreshold =
        json::getFloatOr(obj, "tokenTimestampThreshold", config.tokenTimestampThreshold);
    config.tokenTimestampSumThreshold =
        json::getFloatOr(obj, "tokenTimestampSumThreshold", config.tokenTimestampSumThreshold);
    config.maxSegmentLength = json::getIntOr(obj, "maxSegmentLength", config.maxSegmentLength);
    config.splitOnWord = json::getBoolOr(obj, "splitOnWord", config.splitOnWord);
    config.maxTokens = json::getIntOr(obj, "maxTokens", config.maxTokens);

    config.initialPrompt = json::getStringOr(obj, "initialPrompt", config.initialPrompt);
    config.language = json::getStringOr(obj, "language", config.language);
    config.detectLanguage = json::getBoolOr(obj, "detectLanguage", config.detectLanguage);

    config.suppressBlank = json::getBoolOr(obj, "suppressBlank", config.suppressBlank);
    config.suppressNonSpeechTokens =
        json::getBoolOr(obj, "suppressNonSpeechTokens", config.suppressNonSpeechTokens);

    config.temperature = json::getFloatOr(obj, "temperature", config.temperature);
    config.temperatureIncrement = json::getFloatOr(obj, "temperatureIncrement", config.temperatureIncrement);
    config.entropyThreshold = json::getFloatOr(obj, "entropyThreshold", config.entropyThreshold);
    config.logProbThreshold = json::getFloatOr(obj, "logProbThreshold", config.logProbThreshold);
    config.noSpeechThreshold = json::getFloatOr(obj, "noSpeechThreshold", config.noSpeechThreshold);

    config.greedyBestOf = json::getIntOr(obj, "greedyBestOf", config.greedyBestOf);
    config.beamSize = json::getIntOr(obj, "beamSize", config.beamSize);

    return config;
}

auto toJson(const RunConfiguration& config) -> nlohmann::json
{
    return nlohmann::json {
        { "strategy", std::string(samplingStrategyName(config.strategy)) },
        { "threads", config.threads },
        { "maxTextContext", config.maxTextContext },
        { "offsetMs", config.offsetMs },
        { "durationMs", config.durationMs },
        { "translate", config.translate },
        { "noContext", config.noContext },
        { "noTimestamps", config.noTimestamps },
        { "singleSegment", config.singleSegment },
        { "printSpecial", config.printSpecial },
        { "printProgress", config.printProgress },
        { "printRealtime", config.printRealtime },
        { "printTimestamps", config.printTimestamps },
        { "tokenTimestamps", config.tokenTimestamps },
        { "tokenTimestampThreshold", config.tokenTimestampThreshold },
        { "tokenTimestampSumThreshold", config.tokenTimestampSumThreshold },
        { "maxSegmentLength", config.maxSegmentLength },
        { "splitOnWord", config.splitOnWord },
        { "maxTokens", config.maxTokens },
        { "initialPrompt", config.initialPrompt },
        { "language", config.language },
        { "detectLanguage", config.detectLanguage },
        { "suppressBlank", config.suppressBlank },
        { "suppressNonSpeechTokens", config.suppressNonSpeechTokens },
        { "temperature", config.temperature },
        { "temperatureIncrement", config.temperatureIncrement },
        { "entropyThreshold", config.entropyThreshold },
        { "logProbThreshold", config.logProbThreshold },
        { "noSpeechThreshold", config.noSpeechThreshold },
        { "greedyBestOf", config.greedyBestOf },
        { "beamSize", config.beamSize },
    };
}

} // namespace scribe
