#pragma once

#include <array>
#include <JuceHeader.h>

namespace ParamRanges
{
constexpr int kNumBands = 5;
constexpr int kMaxInterleave = 10;

// Coefficient clamps.
constexpr double kFallbackSampleRateHz = 44100.0;
constexpr double kMinQ = 1.0e-6;
constexpr double kMaxQ = 1000.0;
constexpr double kDefaultQ = 0.707;
constexpr double kMinCutoffHz = 1.0;
constexpr double kMaxCutoffNyquistRatio = 0.99;
constexpr double kDefaultCutoffHz = 1000.0;
constexpr double kMinFilterGainDb = -48.0;
constexpr double kMaxFilterGainDb = 48.0;

// Band/chain gain staging.
constexpr float kMinGainDb = -60.0f;
constexpr float kMaxGainDb = 24.0f;
// Ramp time for gain and dry/wet moves.
constexpr double kGainRampSeconds = 0.05;

// Peak meter decays 12 dB over this time after silence.
constexpr double kMeterDecayMs = 100.0;
constexpr float kMeterFloorDb = -120.0f;

// Default band layout.
extern const std::array<float, kNumBands> kDefaultBandFrequencies;

int clampInterleave(int count);
float clampGainDb(float gainDb);
float clampDryWet(float dryWet);
// Band index validity for control-side setters.
bool isValidBand(int bandIndex);
} // namespace ParamRanges
