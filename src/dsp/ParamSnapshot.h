#pragma once

#include <array>
#include "BiquadCoefficients.h"
#include "../util/ParamRanges.h"

namespace interleaf
{
// Snapshot of one band's parameters (thread-safe copy).
struct BandSnapshot
{
    FilterParams params;
    int interleaveCount = 1;
    bool enabled = true;
    bool oversampled = false;
    float inputGainDb = 0.0f;
    float outputGainDb = 0.0f;
    float dryWet = 1.0f;
};

// Full parameter snapshot used by the audio thread.
struct ChainSnapshot
{
    std::array<BandSnapshot, ParamRanges::kNumBands> bands {};
    float inputGainDb = 0.0f;
    float outputGainDb = 0.0f;
    float dryWet = 1.0f;
};

// Default layout: five flat peaking bands from 120 Hz to 12 kHz.
inline ChainSnapshot makeDefaultSnapshot()
{
    ChainSnapshot snapshot;
    for (int band = 0; band < ParamRanges::kNumBands; ++band)
    {
        auto& dst = snapshot.bands[static_cast<size_t>(band)];
        dst.params.type = FilterType::peaking;
        dst.params.cutoffHz = ParamRanges::kDefaultBandFrequencies[static_cast<size_t>(band)];
        dst.params.q = static_cast<float>(ParamRanges::kDefaultQ);
        dst.params.gainDb = 0.0f;
    }
    return snapshot;
}
} // namespace interleaf
