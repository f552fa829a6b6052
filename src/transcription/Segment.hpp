// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scribe
{

class InferenceEngine;

/// @brief Engine timestamps are counted in 10 ms ticks.
constexpr auto MillisecondsPerEngineTick = std::int64_t { 10 };

/// @brief Converts an engine timestamp to whole milliseconds.
[[nodiscard]] constexpr auto engineTicksToMilliseconds(std::int64_t ticks) -> std::int64_t
{
    return ticks * MillisecondsPerEngineTick;
}

/// @brief One recognized span of speech.
struct Segment
{
    std::int64_t startTimeMs = 0;
    std::int64_t endTimeMs = 0;
    std::string text;

    [[nodiscard]] auto operator==(const Segment&) const -> bool = default;
};

/// @brief Reads segment @p index from the engine's current result.
/// @return The segment, or std::nullopt if the engine reports no text for it.
[[nodiscard]] auto segmentFromEngine(const InferenceEngine& engine, int index) -> std::optional<Segment>;

/// @brief Reads segments [@p first, @p last) from the engine, skipping those without text.
[[nodiscard]] auto segmentsFromEngine(const InferenceEngine& engine, int first, int last) -> std::vector<Segment>;

/// @brief Formats milliseconds as HH:MM:SS.mmm.
[[nodiscard]] auto formatTimestamp(std::int64_t milliseconds) -> std::string;

} // namespace scribe
