#include <catch2/catch.hpp>
#include <limits>
#include "app/RenderLength.h"

using namespace interleaf;

TEST_CASE("Render length adds the latency tail", "[render]")
{
    int length = -1;
    REQUIRE(computeRenderLength(44100, 7, length).wasOk());
    CHECK(length == 44107);

    REQUIRE(computeRenderLength(1, 0, length).wasOk());
    CHECK(length == 1);
}

TEST_CASE("Render length rejects sizes an audio buffer cannot hold", "[render]")
{
    const auto intMax = static_cast<juce::int64>(std::numeric_limits<int>::max());
    int length = 123;

    CHECK(computeRenderLength(0, 0, length).failed());
    CHECK(computeRenderLength(-5, 0, length).failed());
    CHECK(computeRenderLength(intMax + 1, 0, length).failed());
    CHECK(computeRenderLength(intMax, 1, length).failed());
    CHECK(computeRenderLength(10, -1, length).failed());
    CHECK(length == 123);

    REQUIRE(computeRenderLength(intMax - 4, 4, length).wasOk());
    CHECK(length == std::numeric_limits<int>::max());
}
