#include "InterleaveBank.h"

namespace interleaf
{
void InterleaveBank::setCoefficients(const Coefficients& newCoefficients)
{
    coeffs = newCoefficients;
    for (auto& instance : instances)
        instance.setCoefficients(coeffs);
}

void InterleaveBank::setInterleaveCount(int count)
{
    const int clamped = ParamRanges::clampInterleave(count);

    // Slots leaving the active range are cleared so they come back cold.
    for (int i = clamped; i < activeCount; ++i)
        instances[static_cast<size_t>(i)].reset();

    activeCount = clamped;
}

void InterleaveBank::reset()
{
    for (auto& instance : instances)
        instance.reset();
}

float InterleaveBank::processSample(float x)
{
    if (activeCount == 0)
        return x;

    double sum = 0.0;
    for (int i = 0; i < activeCount; ++i)
        sum += instances[static_cast<size_t>(i)].processSample(x);

    return static_cast<float>(sum / static_cast<double>(activeCount));
}

const Biquad& InterleaveBank::getInstance(int index) const
{
    return instances[static_cast<size_t>(juce::jlimit(0, kCapacity - 1, index))];
}
} // namespace interleaf
