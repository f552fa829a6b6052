// SPDX-License-Identifier: Apache-2.0
#include <transcription/Segment.hpp>

#include <catch2/catch_test_macros.hpp>

#include "ScriptedEngine.hpp"

using namespace scribe;
using scribe::test::NativeSegment;
using scribe::test::ScriptedEngine;

TEST_CASE("engineTicksToMilliseconds multiplies by ten", "[segment]")
{
    CHECK(engineTicksToMilliseconds(0) == 0);
    CHECK(engineTicksToMilliseconds(150) == 1500);
    CHECK(engineTicksToMilliseconds(360000) == 3600000);
}

TEST_CASE("segmentsFromEngine reads a half-open index range", "[segment]")
{
    auto engine = ScriptedEngine({
        { NativeSegment { .t0 = 0, .t1 = 150, .text = "one" },
          NativeSegment { .t0 = 150, .t1 = 300, .text = "two" },
          NativeSegment { .t0 = 300, .t1 = 450, .text = "three" } },
    });
    REQUIRE(engine.runFull(RunConfiguration {}, std::vector<float>(16000, 0.0f)).has_value());

    auto const middle = segmentsFromEngine(engine, 1, 3);
    REQUIRE(middle.size() == 2);
    CHECK(middle[0] == Segment { .startTimeMs = 1500, .endTimeMs = 3000, .text = "two" });
    CHECK(middle[1] == Segment { .startTimeMs = 3000, .endTimeMs = 4500, .text = "three" });

    CHECK(segmentsFromEngine(engine, 2, 2).empty());
    CHECK(segmentsFromEngine(engine, 3, 1).empty());
}

TEST_CASE("segmentFromEngine returns nothing for segments without text", "[segment]")
{
    auto engine = ScriptedEngine({ { NativeSegment { .t0 = 0, .t1 = 10, .text = std::nullopt } } });
    REQUIRE(engine.runFull(RunConfiguration {}, std::vector<float>(160, 0.0f)).has_value());

    CHECK(!segmentFromEngine(engine, 0).has_value());
}

TEST_CASE("formatTimestamp renders hours, minutes, seconds and milliseconds", "[segment]")
{
    CHECK(formatTimestamp(0) == "00:00:00.000");
    CHECK(formatTimestamp(1500) == "00:00:01.500");
    CHECK(formatTimestamp(61'001) == "00:01:01.001");
    CHECK(formatTimestamp(3'723'456) == "01:02:03.456");
    CHECK(formatTimestamp(-5) == "00:00:00.000");
}
