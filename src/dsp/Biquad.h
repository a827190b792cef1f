#pragma once

#include <JuceHeader.h>
#include "BiquadCoefficients.h"

namespace interleaf
{
// Input/output history of one direct form I biquad.
struct BiquadHistory
{
    double x1 = 0.0;
    double x2 = 0.0;
    double y1 = 0.0;
    double y2 = 0.0;
};

// Direct form I biquad with externally supplied coefficients.
class Biquad
{
public:
    // Replace coefficients, history is kept.
    void setCoefficients(const Coefficients& newCoefficients);
    const Coefficients& getCoefficients() const { return coeffs; }

    // Zero the history, coefficients are kept.
    void reset();

    float processSample(float x);

    // Debug accessors for history.
    const BiquadHistory& getState() const { return history; }
    void setState(const BiquadHistory& newHistory);
    bool isCleared() const;

private:
    Coefficients coeffs;
    BiquadHistory history;
};
} // namespace interleaf
