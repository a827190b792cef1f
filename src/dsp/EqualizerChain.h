#pragma once

#include <array>
#include <atomic>
#include <JuceHeader.h>
#include "Band.h"
#include "DryDelay.h"
#include "LevelMeter.h"
#include "ParamSnapshot.h"
#include "SnapshotExchange.h"

namespace interleaf
{
// Fixed series of bands with top-level gain, dry/wet and metering.
// Setters run on control threads and publish whole snapshots; the audio thread
// picks the newest one up at the start of a sample.
class EqualizerChain
{
public:
    EqualizerChain();

    // Prepare every band for a stream rate (control thread, stream stopped).
    void configure(double sampleRateHz);
    bool isConfigured() const { return configured.load(std::memory_order_acquire); }
    double getSampleRate() const { return sampleRate; }

    // Control-thread parameter updates.
    void setBandParams(int bandIndex, const FilterParams& params, int interleaveCount, bool enabled);
    void setBandMix(int bandIndex, float inputGainDb, float outputGainDb, float dryWet);
    void setBandOversampling(int bandIndex, bool oversampled);
    void setChainGain(float inputGainDb, float outputGainDb, float dryWet);
    ChainSnapshot getPendingSnapshot() const;

    // Wipe all history at the start of the next sample; coefficients are kept
    // and gain ramps jump to their targets.
    void reset();

    // Realtime entry points.
    float processSample(float x);
    void processBlock(float* data, int numSamples);

    // Total group delay of the enabled oversampled bands, in host samples.
    int getLatencySamples() const { return latencySamples.load(std::memory_order_relaxed); }

    // Meter readbacks; the input meter sits after the chain input gain.
    float getInputLevelDb() const { return inputMeter.getLevelDb(); }
    float getOutputLevelDb() const { return outputMeter.getLevelDb(); }

    // Log diagnostics raised on the audio thread. Returns true if any were pending.
    bool flushDiagnostics();

    // Audio-thread state accessors (tests/diagnostics).
    const Band& getBand(int bandIndex) const;

private:
    void publishPending();
    void applySnapshot(const ChainSnapshot& snapshot);
    void resetState();

    std::array<Band, ParamRanges::kNumBands> bands;
    SnapshotExchange<ChainSnapshot> exchange;

    // Control side.
    juce::CriticalSection controlLock;
    ChainSnapshot pending;

    // Audio side.
    double sampleRate = 0.0;
    juce::SmoothedValue<float, juce::ValueSmoothingTypes::Multiplicative> inputGain;
    juce::SmoothedValue<float, juce::ValueSmoothingTypes::Multiplicative> outputGain;
    juce::SmoothedValue<float> dryWet { 1.0f };
    DryDelay dryDelay;
    LevelMeter inputMeter;
    LevelMeter outputMeter;

    std::atomic<bool> configured { false };
    std::atomic<bool> resetRequested { false };
    std::atomic<int> latencySamples { 0 };
    std::atomic<bool> unconfiguredReported { false };
    std::atomic<bool> pendingUnconfiguredLog { false };
    std::atomic<bool> pendingNonFiniteLog { false };

    JUCE_DECLARE_NON_COPYABLE(EqualizerChain)
};
} // namespace interleaf
