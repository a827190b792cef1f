#include "LevelMeter.h"
#include "../util/ParamRanges.h"
#include <cmath>

namespace interleaf
{
void LevelMeter::prepare(double sampleRate)
{
    // 0.25 in amplitude is -12 dB.
    const double samples = juce::jmax(1.0, sampleRate * ParamRanges::kMeterDecayMs / 1000.0);
    decayWeight = static_cast<float>(std::pow(0.25, 1.0 / samples));
    reset();
}

void LevelMeter::reset()
{
    current = 0.0f;
    level.store(0.0f, std::memory_order_relaxed);
}

void LevelMeter::process(float x)
{
    const float amplitude = std::isfinite(x) ? std::abs(x) : 0.0f;
    if (amplitude > current)
        current = amplitude;
    else
        current = current * decayWeight + amplitude * (1.0f - decayWeight);

    level.store(current, std::memory_order_relaxed);
}

float LevelMeter::getLevelDb() const
{
    return juce::Decibels::gainToDecibels(getLevel(), ParamRanges::kMeterFloorDb);
}
} // namespace interleaf
