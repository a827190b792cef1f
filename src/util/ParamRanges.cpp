#include "ParamRanges.h"
#include <cmath>

namespace ParamRanges
{
const std::array<float, kNumBands> kDefaultBandFrequencies { 120.0f, 360.0f, 1200.0f, 5000.0f, 12000.0f };

int clampInterleave(int count)
{
    return juce::jlimit(0, kMaxInterleave, count);
}

float clampGainDb(float gainDb)
{
    if (std::isnan(gainDb))
        return 0.0f;
    return juce::jlimit(kMinGainDb, kMaxGainDb, gainDb);
}

float clampDryWet(float dryWet)
{
    if (std::isnan(dryWet))
        return 1.0f;
    return juce::jlimit(0.0f, 1.0f, dryWet);
}

bool isValidBand(int bandIndex)
{
    return bandIndex >= 0 && bandIndex < kNumBands;
}
} // namespace ParamRanges
