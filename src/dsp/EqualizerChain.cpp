#include "EqualizerChain.h"
#include <cmath>

namespace interleaf
{
EqualizerChain::EqualizerChain()
    : exchange(makeDefaultSnapshot()),
      pending(makeDefaultSnapshot())
{
}

void EqualizerChain::configure(double sampleRateHz)
{
    double rate = sampleRateHz;
    if (! std::isfinite(rate) || rate <= 0.0)
    {
        jassertfalse;
        juce::Logger::writeToLog("Interleaf: configure called with invalid sample rate "
                                 + juce::String(sampleRateHz) + ", using "
                                 + juce::String(ParamRanges::kFallbackSampleRateHz));
        rate = ParamRanges::kFallbackSampleRateHz;
    }

    configured.store(false, std::memory_order_release);
    sampleRate = rate;

    ChainSnapshot snapshot;
    {
        const juce::ScopedLock lock(controlLock);
        snapshot = pending;
    }

    for (auto& band : bands)
        band.prepare(sampleRate);
    inputMeter.prepare(sampleRate);
    outputMeter.prepare(sampleRate);
    inputGain.reset(sampleRate, ParamRanges::kGainRampSeconds);
    outputGain.reset(sampleRate, ParamRanges::kGainRampSeconds);
    dryWet.reset(sampleRate, ParamRanges::kGainRampSeconds);

    applySnapshot(snapshot);
    resetState();
    resetRequested.store(false);

    configured.store(true, std::memory_order_release);

    juce::Logger::writeToLog("Interleaf: configured at " + juce::String(sampleRate, 1)
                             + " Hz, latency " + juce::String(getLatencySamples()) + " samples");
}

void EqualizerChain::setBandParams(int bandIndex, const FilterParams& params, int interleaveCount, bool enabled)
{
    if (! ParamRanges::isValidBand(bandIndex))
    {
        jassertfalse;
        juce::Logger::writeToLog("Interleaf: setBandParams ignored, band index " + juce::String(bandIndex));
        return;
    }

    const juce::ScopedLock lock(controlLock);
    auto& dst = pending.bands[static_cast<size_t>(bandIndex)];
    dst.params = params;
    dst.interleaveCount = ParamRanges::clampInterleave(interleaveCount);
    dst.enabled = enabled;
    publishPending();
}

void EqualizerChain::setBandMix(int bandIndex, float inputGainDb, float outputGainDb, float dryWetAmount)
{
    if (! ParamRanges::isValidBand(bandIndex))
    {
        jassertfalse;
        juce::Logger::writeToLog("Interleaf: setBandMix ignored, band index " + juce::String(bandIndex));
        return;
    }

    const juce::ScopedLock lock(controlLock);
    auto& dst = pending.bands[static_cast<size_t>(bandIndex)];
    dst.inputGainDb = ParamRanges::clampGainDb(inputGainDb);
    dst.outputGainDb = ParamRanges::clampGainDb(outputGainDb);
    dst.dryWet = ParamRanges::clampDryWet(dryWetAmount);
    publishPending();
}

void EqualizerChain::setBandOversampling(int bandIndex, bool oversampled)
{
    if (! ParamRanges::isValidBand(bandIndex))
    {
        jassertfalse;
        juce::Logger::writeToLog("Interleaf: setBandOversampling ignored, band index " + juce::String(bandIndex));
        return;
    }

    const juce::ScopedLock lock(controlLock);
    pending.bands[static_cast<size_t>(bandIndex)].oversampled = oversampled;
    publishPending();
}

void EqualizerChain::setChainGain(float inputGainDb, float outputGainDb, float dryWetAmount)
{
    const juce::ScopedLock lock(controlLock);
    pending.inputGainDb = ParamRanges::clampGainDb(inputGainDb);
    pending.outputGainDb = ParamRanges::clampGainDb(outputGainDb);
    pending.dryWet = ParamRanges::clampDryWet(dryWetAmount);
    publishPending();
}

ChainSnapshot EqualizerChain::getPendingSnapshot() const
{
    const juce::ScopedLock lock(controlLock);
    return pending;
}

void EqualizerChain::reset()
{
    resetRequested.store(true, std::memory_order_release);
}

float EqualizerChain::processSample(float x)
{
    // Critical path: no locks, no allocation, no logging.
    if (! configured.load(std::memory_order_acquire))
    {
        if (! unconfiguredReported.exchange(true, std::memory_order_relaxed))
            pendingUnconfiguredLog.store(true, std::memory_order_relaxed);
        return x;
    }

    if (resetRequested.exchange(false, std::memory_order_acq_rel))
        resetState();

    if (exchange.acquire())
        applySnapshot(exchange.current());

    const float gained = x * inputGain.getNextValue();
    inputMeter.process(gained);

    float wet = gained;
    for (auto& band : bands)
        wet = band.processSample(wet);

    const float dry = dryDelay.processSample(gained);
    const float mix = dryWet.getNextValue();
    float out = outputGain.getNextValue() * (mix * wet + (1.0f - mix) * dry);

    bool recovered = false;
    for (auto& band : bands)
        recovered = band.consumeRecoveryFlag() || recovered;

    if (! std::isfinite(out))
    {
        out = 0.0f;
        resetState();
        recovered = true;
    }

    if (recovered)
        pendingNonFiniteLog.store(true, std::memory_order_relaxed);

    outputMeter.process(out);
    return out;
}

void EqualizerChain::processBlock(float* data, int numSamples)
{
    if (data == nullptr || numSamples <= 0)
        return;

    juce::ScopedNoDenormals noDenormals;
    for (int i = 0; i < numSamples; ++i)
        data[i] = processSample(data[i]);
}

bool EqualizerChain::flushDiagnostics()
{
    bool reported = false;

    if (pendingUnconfiguredLog.exchange(false))
    {
        juce::Logger::writeToLog("Interleaf: processSample called before configure, passing audio through");
        reported = true;
    }

    if (pendingNonFiniteLog.exchange(false))
    {
        juce::Logger::writeToLog("Interleaf: non-finite output replaced with silence, filter history reset");
        reported = true;
    }

    return reported;
}

const Band& EqualizerChain::getBand(int bandIndex) const
{
    return bands[static_cast<size_t>(juce::jlimit(0, ParamRanges::kNumBands - 1, bandIndex))];
}

void EqualizerChain::publishPending()
{
    exchange.publish(pending);
}

void EqualizerChain::applySnapshot(const ChainSnapshot& snapshot)
{
    int latency = 0;
    for (int i = 0; i < ParamRanges::kNumBands; ++i)
    {
        auto& band = bands[static_cast<size_t>(i)];
        band.applySnapshot(snapshot.bands[static_cast<size_t>(i)]);
        latency += band.getLatencySamples();
    }

    inputGain.setTargetValue(juce::Decibels::decibelsToGain(ParamRanges::clampGainDb(snapshot.inputGainDb)));
    outputGain.setTargetValue(juce::Decibels::decibelsToGain(ParamRanges::clampGainDb(snapshot.outputGainDb)));
    dryWet.setTargetValue(ParamRanges::clampDryWet(snapshot.dryWet));

    dryDelay.setDelaySamples(latency);
    latencySamples.store(latency, std::memory_order_relaxed);
}

void EqualizerChain::resetState()
{
    for (auto& band : bands)
        band.reset();
    dryDelay.reset();
    inputGain.setCurrentAndTargetValue(inputGain.getTargetValue());
    outputGain.setCurrentAndTargetValue(outputGain.getTargetValue());
    dryWet.setCurrentAndTargetValue(dryWet.getTargetValue());
}
} // namespace interleaf
