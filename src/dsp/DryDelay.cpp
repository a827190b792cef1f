#include "DryDelay.h"

namespace interleaf
{
void DryDelay::setDelaySamples(int samples)
{
    // The line keeps recording at every length, so only the read offset moves.
    delaySamples = juce::jlimit(0, kMaxDelaySamples, samples);
}

void DryDelay::reset()
{
    line.fill(0.0f);
    writePos = 0;
}

float DryDelay::processSample(float x)
{
    constexpr int size = kMaxDelaySamples + 1;
    line[static_cast<size_t>(writePos)] = x;
    int readPos = writePos - delaySamples;
    if (readPos < 0)
        readPos += size;
    writePos = (writePos + 1) % size;
    return line[static_cast<size_t>(readPos)];
}
} // namespace interleaf
