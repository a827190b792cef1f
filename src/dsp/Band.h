#pragma once

#include <JuceHeader.h>
#include "InterleaveBank.h"
#include "Oversampler.h"
#include "DryDelay.h"
#include "ParamSnapshot.h"

namespace interleaf
{
// One equalizer band: gain staging, dry/wet and an interleave bank,
// optionally run at twice the host rate.
class Band
{
public:
    Band();

    // Prepare for a host sample rate (control thread, stream stopped).
    void prepare(double hostSampleRate);
    // Zero filter, oversampler and dry-line history; gain ramps jump to their targets.
    void reset();

    // Apply a complete parameter snapshot between samples (audio thread).
    void applySnapshot(const BandSnapshot& snapshot);

    float processSample(float x);

    // Reported group delay in host samples.
    int getLatencySamples() const;

    bool isEnabled() const { return enabled; }
    bool isOversampled() const { return oversampled; }
    // Rate the coefficients were derived at (doubled when oversampled).
    double getProcessingSampleRate() const;
    const FilterParams& getEffectiveParams() const { return effectiveParams; }
    const InterleaveBank& getBank() const { return bank; }

    // True once after a non-finite filter output forced a reset.
    bool consumeRecoveryFlag();

private:
    void updateCoefficients(const FilterParams& params);
    float processFiltered(float x);

    InterleaveBank bank;
    Oversampler oversampler;
    DryDelay dryDelay;

    double hostRate = ParamRanges::kFallbackSampleRateHz;
    FilterParams requestedParams;
    FilterParams effectiveParams;
    bool coefficientsValid = false;
    bool enabled = true;
    bool oversampled = false;
    juce::SmoothedValue<float, juce::ValueSmoothingTypes::Multiplicative> inputGain;
    juce::SmoothedValue<float, juce::ValueSmoothingTypes::Multiplicative> outputGain;
    juce::SmoothedValue<float> dryWet { 1.0f };
    bool recovered = false;

    JUCE_DECLARE_NON_COPYABLE(Band)
};
} // namespace interleaf
