// SPDX-License-Identifier: Apache-2.0
#include "Segment.hpp"

#include <engine/InferenceEngine.hpp>

#include <algorithm>
#include <format>

namespace scribe
{

auto segmentFromEngine(const InferenceEngine& engine, int index) -> std::optional<Segment>
{
    auto text = engine.segmentText(index);
    if (!text)
        return std::nullopt;

    return Segment {
        .startTimeMs = engineTicksToMilliseconds(engine.segmentStart(index)),
        .endTimeMs = engineTicksToMilliseconds(engine.segmentEnd(index)),
        .text = std::move(*text),
    };
}

auto segmentsFromEngine(const InferenceEngine& engine, int first, int last) -> std::vector<Segment>
{
    auto segments = std::vector<Segment> {};
    if (last <= first)
        return segments;

    segments.reserve(static_cast<std::size_t>(last - first));
    for (auto i = first; i < last; ++i)
    {
        if (auto segment = segmentFromEngine(engine, i))
            segments.push_back(std::move(*segment));
    }
    return segments;
}

auto formatTimestamp(std::int64_t milliseconds) -> std::string
{
    milliseconds = std::max<std::int64_t>(milliseconds, 0);
    auto const hours = milliseconds / 3'600'000;
    auto const minutes = (milliseconds / 60'000) % 60;
    auto const seconds = (milliseconds / 1000) % 60;
    auto const millis = milliseconds % 1000;
    return std::format("{:02}:{:02}:{:02}.{:03}", hours, minutes, seconds, millis);
}

} // namespace scribe
