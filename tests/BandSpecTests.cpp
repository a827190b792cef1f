#include <catch2/catch.hpp>
#include "app/BandSpec.h"

using namespace interleaf;

TEST_CASE("Filter type names parse", "[bandspec]")
{
    FilterType type = FilterType::peaking;
    CHECK(parseFilterType("lowpass", type));
    CHECK(type == FilterType::lowPass);
    CHECK(parseFilterType(" HighShelf ", type));
    CHECK(type == FilterType::highShelf);
    CHECK_FALSE(parseFilterType("allpass", type));
}

TEST_CASE("Well-formed band arguments parse", "[bandspec]")
{
    BandSpec spec;
    REQUIRE(parseBandSpec("2,peak,1000,0.707,6,10", spec).wasOk());
    CHECK(spec.index == 2);
    CHECK(spec.params.type == FilterType::peaking);
    CHECK(spec.params.cutoffHz == Approx(1000.0f));
    CHECK(spec.params.q == Approx(0.707f));
    CHECK(spec.params.gainDb == Approx(6.0f));
    CHECK(spec.interleaveCount == 10);
    CHECK_FALSE(spec.oversampled);

    REQUIRE(parseBandSpec("0, lowpass, 250, 1.5, -3, 0, os", spec).wasOk());
    CHECK(spec.index == 0);
    CHECK(spec.params.type == FilterType::lowPass);
    CHECK(spec.interleaveCount == 0);
    CHECK(spec.oversampled);
}

TEST_CASE("Malformed band arguments are rejected", "[bandspec]")
{
    BandSpec spec;
    CHECK(parseBandSpec("", spec).failed());
    CHECK(parseBandSpec("0,peak,1000,0.7,0", spec).failed());
    CHECK(parseBandSpec("5,peak,1000,0.7,0,1", spec).failed());
    CHECK(parseBandSpec("-1,peak,1000,0.7,0,1", spec).failed());
    CHECK(parseBandSpec("x,peak,1000,0.7,0,1", spec).failed());
    CHECK(parseBandSpec("0,allpass,1000,0.7,0,1", spec).failed());
    CHECK(parseBandSpec("0,peak,abc,0.7,0,1", spec).failed());
    CHECK(parseBandSpec("0,peak,1000,0.7,0,11", spec).failed());
    CHECK(parseBandSpec("0,peak,1000,0.7,0,1.5", spec).failed());
    CHECK(parseBandSpec("0,peak,1000,0.7,0,1,fast", spec).failed());
}

TEST_CASE("Rejected arguments leave the spec untouched", "[bandspec]")
{
    BandSpec spec;
    spec.index = 3;
    spec.interleaveCount = 4;
    CHECK(parseBandSpec("1,notch,1000,0.7,0,99", spec).failed());
    CHECK(spec.index == 3);
    CHECK(spec.interleaveCount == 4);
}
