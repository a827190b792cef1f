#include <catch2/catch.hpp>
#include <limits>
#include "dsp/LevelMeter.h"
#include "util/ParamRanges.h"

using namespace interleaf;

TEST_CASE("Meter attacks instantly", "[meter]")
{
    LevelMeter meter;
    meter.prepare(48000.0);
    meter.process(-0.5f);
    CHECK(meter.getLevel() == 0.5f);
    CHECK(meter.getLevelDb() == Approx(-6.02).margin(0.01));
}

TEST_CASE("Meter falls 12 dB over 100 ms", "[meter]")
{
    LevelMeter meter;
    meter.prepare(1000.0);
    meter.process(1.0f);
    for (int i = 0; i < 100; ++i)
        meter.process(0.0f);

    CHECK(meter.getLevel() == Approx(0.25f).epsilon(1.0e-3));
    CHECK(meter.getLevelDb() == Approx(-12.04).margin(0.05));
}

TEST_CASE("Silent meter sits at the floor", "[meter]")
{
    LevelMeter meter;
    meter.prepare(44100.0);
    CHECK(meter.getLevelDb() == Approx(ParamRanges::kMeterFloorDb));

    meter.process(1.0f);
    meter.reset();
    CHECK(meter.getLevel() == 0.0f);
}

TEST_CASE("Non-finite input does not poison the meter", "[meter]")
{
    LevelMeter meter;
    meter.prepare(44100.0);
    meter.process(std::numeric_limits<float>::infinity());
    meter.process(std::numeric_limits<float>::quiet_NaN());
    CHECK(meter.getLevel() == 0.0f);
}
