#pragma once

#include <JuceHeader.h>
#include "../dsp/BiquadCoefficients.h"

namespace interleaf
{
// One --band=INDEX,TYPE,FREQ,Q,GAIN_DB,INTERLEAVE[,os] argument.
struct BandSpec
{
    int index = 0;
    FilterParams params;
    int interleaveCount = 1;
    bool oversampled = false;
};

bool parseFilterType(const juce::String& text, FilterType& type);
juce::Result parseBandSpec(const juce::String& text, BandSpec& spec);
} // namespace interleaf
