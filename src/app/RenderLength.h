#pragma once

#include <JuceHeader.h>

namespace interleaf
{
// Buffer length for a file of inputLength samples plus the latency tail.
// Fails when the file is empty or the total does not fit an AudioBuffer.
juce::Result computeRenderLength(juce::int64 inputLength, int latencySamples, int& bufferLength);
} // namespace interleaf
