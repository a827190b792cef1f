#include "BiquadCoefficients.h"
#include "../util/ParamRanges.h"
#include <cmath>

namespace interleaf
{
FilterParams sanitize(const FilterParams& params)
{
    FilterParams out = params;

    if (! std::isfinite(out.sampleRateHz) || out.sampleRateHz <= 0.0)
    {
        jassertfalse;
        out.sampleRateHz = ParamRanges::kFallbackSampleRateHz;
    }

    const double nyquist = out.sampleRateHz * 0.5;
    const double maxCutoff = nyquist * ParamRanges::kMaxCutoffNyquistRatio;

    // Below ~2 Hz sample rate the Nyquist bound wins over the 1 Hz floor.
    const double minCutoff = juce::jmin(ParamRanges::kMinCutoffHz, maxCutoff);

    double cutoff = std::isnan(out.cutoffHz) ? ParamRanges::kDefaultCutoffHz : out.cutoffHz;
    cutoff = juce::jlimit(minCutoff, maxCutoff, cutoff);
    out.cutoffHz = static_cast<float>(cutoff);

    double q = std::isnan(out.q) ? ParamRanges::kDefaultQ : out.q;
    q = juce::jlimit(ParamRanges::kMinQ, ParamRanges::kMaxQ, q);
    out.q = static_cast<float>(q);

    double gainDb = std::isnan(out.gainDb) ? 0.0 : out.gainDb;
    gainDb = juce::jlimit(ParamRanges::kMinFilterGainDb, ParamRanges::kMaxFilterGainDb, gainDb);
    out.gainDb = static_cast<float>(gainDb);

    return out;
}

Coefficients makeCoefficients(const FilterParams& rawParams)
{
    const auto params = sanitize(rawParams);

    constexpr double kPi = 3.14159265358979323846;
    const double omega = 2.0 * kPi * static_cast<double>(params.cutoffHz) / params.sampleRateHz;
    const double sinW = std::sin(omega);
    const double cosW = std::cos(omega);
    const double alpha = sinW / (2.0 * static_cast<double>(params.q));
    const double a = std::pow(10.0, static_cast<double>(params.gainDb) / 40.0);

    double b0d = 1.0;
    double b1d = 0.0;
    double b2d = 0.0;
    double a0d = 1.0;
    double a1d = 0.0;
    double a2d = 0.0;

    switch (params.type)
    {
        case FilterType::lowPass:
            b0d = (1.0 - cosW) * 0.5;
            b1d = 1.0 - cosW;
            b2d = (1.0 - cosW) * 0.5;
            a0d = 1.0 + alpha;
            a1d = -2.0 * cosW;
            a2d = 1.0 - alpha;
            break;
        case FilterType::highPass:
            b0d = (1.0 + cosW) * 0.5;
            b1d = -(1.0 + cosW);
            b2d = (1.0 + cosW) * 0.5;
            a0d = 1.0 + alpha;
            a1d = -2.0 * cosW;
            a2d = 1.0 - alpha;
            break;
        case FilterType::bandPass:
            b0d = alpha;
            b1d = 0.0;
            b2d = -alpha;
            a0d = 1.0 + alpha;
            a1d = -2.0 * cosW;
            a2d = 1.0 - alpha;
            break;
        case FilterType::notch:
            b0d = 1.0;
            b1d = -2.0 * cosW;
            b2d = 1.0;
            a0d = 1.0 + alpha;
            a1d = -2.0 * cosW;
            a2d = 1.0 - alpha;
            break;
        case FilterType::peaking:
            b0d = 1.0 + alpha * a;
            b1d = -2.0 * cosW;
            b2d = 1.0 - alpha * a;
            a0d = 1.0 + alpha / a;
            a1d = -2.0 * cosW;
            a2d = 1.0 - alpha / a;
            break;
        case FilterType::lowShelf:
        {
            const double twoSqrtAAlpha = 2.0 * std::sqrt(a) * alpha;
            b0d = a * ((a + 1.0) - (a - 1.0) * cosW + twoSqrtAAlpha);
            b1d = 2.0 * a * ((a - 1.0) - (a + 1.0) * cosW);
            b2d = a * ((a + 1.0) - (a - 1.0) * cosW - twoSqrtAAlpha);
            a0d = (a + 1.0) + (a - 1.0) * cosW + twoSqrtAAlpha;
            a1d = -2.0 * ((a - 1.0) + (a + 1.0) * cosW);
            a2d = (a + 1.0) + (a - 1.0) * cosW - twoSqrtAAlpha;
            break;
        }
        case FilterType::highShelf:
        {
            const double twoSqrtAAlpha = 2.0 * std::sqrt(a) * alpha;
            b0d = a * ((a + 1.0) + (a - 1.0) * cosW + twoSqrtAAlpha);
            b1d = -2.0 * a * ((a - 1.0) + (a + 1.0) * cosW);
            b2d = a * ((a + 1.0) + (a - 1.0) * cosW - twoSqrtAAlpha);
            a0d = (a + 1.0) - (a - 1.0) * cosW + twoSqrtAAlpha;
            a1d = 2.0 * ((a - 1.0) - (a + 1.0) * cosW);
            a2d = (a + 1.0) - (a - 1.0) * cosW - twoSqrtAAlpha;
            break;
        }
    }

    const double invA0 = 1.0 / a0d;
    Coefficients c;
    c.b0 = b0d * invA0;
    c.b1 = b1d * invA0;
    c.b2 = b2d * invA0;
    c.a1 = a1d * invA0;
    c.a2 = a2d * invA0;
    return c;
}

bool operator==(const FilterParams& lhs, const FilterParams& rhs)
{
    return lhs.type == rhs.type
        && lhs.cutoffHz == rhs.cutoffHz
        && lhs.q == rhs.q
        && lhs.gainDb == rhs.gainDb
        && lhs.sampleRateHz == rhs.sampleRateHz;
}

bool operator!=(const FilterParams& lhs, const FilterParams& rhs)
{
    return ! (lhs == rhs);
}

bool operator==(const Coefficients& lhs, const Coefficients& rhs)
{
    return lhs.b0 == rhs.b0 && lhs.b1 == rhs.b1 && lhs.b2 == rhs.b2
        && lhs.a1 == rhs.a1 && lhs.a2 == rhs.a2;
}

bool operator!=(const Coefficients& lhs, const Coefficients& rhs)
{
    return ! (lhs == rhs);
}

const char* filterTypeName(FilterType type)
{
    switch (type)
    {
        case FilterType::lowPass: return "lowpass";
        case FilterType::highPass: return "highpass";
        case FilterType::bandPass: return "bandpass";
        case FilterType::notch: return "notch";
        case FilterType::peaking: return "peak";
        case FilterType::lowShelf: return "lowshelf";
        case FilterType::highShelf: return "highshelf";
    }
    return "unknown";
}
} // namespace interleaf
