// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace scribe
{

struct RunConfiguration;

/// @brief Context-level options applied when an engine is created.
struct EngineOptions
{
    bool useGpu = true;
    int gpuDevice = 0;
    bool flashAttention = false;
};

/// @brief Capability interface of a native speech-to-text engine context.
///
/// An instance owns exactly one engine context. runFull() is blocking and
/// invokes RunConfiguration::newSegmentCallback on the calling thread, zero or
/// more times, whenever new segments have been finalized. The segment
/// accessors reflect the state of the most recent runFull().
class InferenceEngine
{
  public:
    virtual ~InferenceEngine() = default;

    /// @brief Runs the full encoder/decoder pipeline over @p samples.
    /// @param config Tuning parameters and the new-segment callback slots.
    /// @param samples Mono float32 PCM at sampleRate().
    /// @return Success, or InferenceFailed if the engine reported an error.
    [[nodiscard]] virtual auto runFull(const RunConfiguration& config, std::span<const float> samples)
        -> VoidResult = 0;

    /// @brief Number of segments produced so far by the current or last run.
    [[nodiscard]] virtual auto segmentCount() const -> int = 0;

    /// @brief Text of segment @p index, or std::nullopt if the engine has none.
    [[nodiscard]] virtual auto segmentText(int index) const -> std::optional<std::string> = 0;

    /// @brief Start time of segment @p index in engine ticks (10 ms each).
    [[nodiscard]] virtual auto segmentStart(int index) const -> std::int64_t = 0;

    /// @brief End time of segment @p index in engine ticks (10 ms each).
    [[nodiscard]] virtual auto segmentEnd(int index) const -> std::int64_t = 0;

    /// @brief Fixed input sample rate of the engine in Hz.
    [[nodiscard]] virtual auto sampleRate() const -> int = 0;
};

} // namespace scribe
