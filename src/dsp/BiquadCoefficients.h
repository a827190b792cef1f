#pragma once

#include <JuceHeader.h>

namespace interleaf
{
// Filter types supported by a band.
enum class FilterType
{
    lowPass = 0,
    highPass,
    bandPass,
    notch,
    peaking,
    lowShelf,
    highShelf
};

// Parameter bundle used to derive one coefficient set.
struct FilterParams
{
    FilterType type = FilterType::peaking;
    float cutoffHz = 1000.0f;
    float q = 0.707f;
    float gainDb = 0.0f;
    double sampleRateHz = 44100.0;
};

// Normalized biquad coefficients (a0 == 1).
struct Coefficients
{
    double b0 = 1.0;
    double b1 = 0.0;
    double b2 = 0.0;
    double a1 = 0.0;
    double a2 = 0.0;
};

// Clamp cutoff/Q/gain/sample rate into the range the RBJ formulas stay finite in.
FilterParams sanitize(const FilterParams& params);

// RBJ cookbook coefficients for the (sanitized) params.
Coefficients makeCoefficients(const FilterParams& params);

bool operator==(const FilterParams& lhs, const FilterParams& rhs);
bool operator!=(const FilterParams& lhs, const FilterParams& rhs);
bool operator==(const Coefficients& lhs, const Coefficients& rhs);
bool operator!=(const Coefficients& lhs, const Coefficients& rhs);

const char* filterTypeName(FilterType type);
} // namespace interleaf
