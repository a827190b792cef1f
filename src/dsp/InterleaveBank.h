#pragma once

#include <array>
#include <JuceHeader.h>
#include "Biquad.h"
#include "../util/ParamRanges.h"

namespace interleaf
{
// N parallel biquads sharing one coefficient set, averaged into one output.
// Every slot has its own history, so instances activated at different times
// drift apart during transients and colour the combined response.
class InterleaveBank
{
public:
    static constexpr int kCapacity = ParamRanges::kMaxInterleave;

    // Apply coefficients to every slot before the next sample.
    void setCoefficients(const Coefficients& newCoefficients);
    const Coefficients& getCoefficients() const { return coeffs; }

    // Clamped to [0, kCapacity]. New slots cold-start, existing slots keep history.
    void setInterleaveCount(int count);
    int getInterleaveCount() const { return activeCount; }

    // Zero the history of every slot.
    void reset();

    // Mean of the active slots; identity when no slot is active.
    float processSample(float x);

    const Biquad& getInstance(int index) const;

private:
    std::array<Biquad, kCapacity> instances {};
    Coefficients coeffs;
    int activeCount = 1;
};
} // namespace interleaf
