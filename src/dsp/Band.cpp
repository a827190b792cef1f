#include "Band.h"
#include <cmath>

namespace interleaf
{
Band::Band()
{
    updateCoefficients(requestedParams);
}

void Band::prepare(double hostSampleRate)
{
    hostRate = hostSampleRate;
    oversampler.prepare(hostRate);
    inputGain.reset(hostRate, ParamRanges::kGainRampSeconds);
    outputGain.reset(hostRate, ParamRanges::kGainRampSeconds);
    dryWet.reset(hostRate, ParamRanges::kGainRampSeconds);
    dryDelay.setDelaySamples(oversampled ? oversampler.getLatencySamples() : 0);

    coefficientsValid = false;
    updateCoefficients(requestedParams);
    reset();
}

void Band::reset()
{
    bank.reset();
    oversampler.reset();
    dryDelay.reset();
    inputGain.setCurrentAndTargetValue(inputGain.getTargetValue());
    outputGain.setCurrentAndTargetValue(outputGain.getTargetValue());
    dryWet.setCurrentAndTargetValue(dryWet.getTargetValue());
}

void Band::applySnapshot(const BandSnapshot& snapshot)
{
    const bool wasEnabled = enabled;
    const bool wasOversampled = oversampled;

    enabled = snapshot.enabled;
    oversampled = snapshot.oversampled;
    inputGain.setTargetValue(juce::Decibels::decibelsToGain(ParamRanges::clampGainDb(snapshot.inputGainDb)));
    outputGain.setTargetValue(juce::Decibels::decibelsToGain(ParamRanges::clampGainDb(snapshot.outputGainDb)));
    dryWet.setTargetValue(ParamRanges::clampDryWet(snapshot.dryWet));

    dryDelay.setDelaySamples(oversampled ? oversampler.getLatencySamples() : 0);
    updateCoefficients(snapshot.params);
    bank.setInterleaveCount(snapshot.interleaveCount);

    // Stale history from before a bypass or a rate switch would click.
    if ((enabled && ! wasEnabled) || oversampled != wasOversampled)
        reset();
}

float Band::processSample(float x)
{
    if (! enabled)
        return x;

    const float inGain = inputGain.getNextValue();
    const float outGain = outputGain.getNextValue();
    const float mix = dryWet.getNextValue();

    const float gained = x * inGain;
    float filtered = processFiltered(gained);
    if (! std::isfinite(filtered))
    {
        reset();
        recovered = true;
        filtered = 0.0f;
    }

    const float wet = filtered * outGain;
    const float delayed = dryDelay.processSample(x);
    if (mix >= 1.0f)
        return wet;

    const float dry = delayed * inGain * outGain;
    return mix * wet + (1.0f - mix) * dry;
}

int Band::getLatencySamples() const
{
    return (enabled && oversampled) ? oversampler.getLatencySamples() : 0;
}

double Band::getProcessingSampleRate() const
{
    return oversampled ? hostRate * Oversampler::kFactor : hostRate;
}

bool Band::consumeRecoveryFlag()
{
    const bool wasRecovered = recovered;
    recovered = false;
    return wasRecovered;
}

void Band::updateCoefficients(const FilterParams& params)
{
    requestedParams = params;
    auto next = params;
    next.sampleRateHz = getProcessingSampleRate();
    next = sanitize(next);

    if (coefficientsValid && next == effectiveParams)
        return;

    effectiveParams = next;
    bank.setCoefficients(makeCoefficients(effectiveParams));
    coefficientsValid = true;
}

float Band::processFiltered(float x)
{
    if (! oversampled)
        return bank.processSample(x);

    return oversampler.processSample(x, [this](float s) { return bank.processSample(s); });
}
} // namespace interleaf
