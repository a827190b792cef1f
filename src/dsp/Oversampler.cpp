#include "Oversampler.h"
#include <cmath>

namespace interleaf
{
Oversampler::Oversampler() = default;

Oversampler::~Oversampler() = default;

void Oversampler::prepare(double hostSampleRate)
{
    hostRate = hostSampleRate;
    oversampling = std::make_unique<juce::dsp::Oversampling<float>>(
        1,
        1,
        juce::dsp::Oversampling<float>::filterHalfBandPolyphaseIIR,
        true,
        true);
    oversampling->initProcessing(1);
    oversampling->reset();
    latencySamples = static_cast<int>(std::lround(oversampling->getLatencyInSamples()));
}

void Oversampler::reset()
{
    if (oversampling != nullptr)
        oversampling->reset();
}
} // namespace interleaf
