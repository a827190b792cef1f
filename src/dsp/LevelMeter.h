#pragma once

#include <atomic>
#include <JuceHeader.h>

namespace interleaf
{
// Peak meter: attacks instantly, falls 12 dB over 100 ms of silence.
// Written on the audio thread, read from any thread.
class LevelMeter
{
public:
    void prepare(double sampleRate);
    void reset();

    void process(float x);

    float getLevel() const { return level.load(std::memory_order_relaxed); }
    float getLevelDb() const;

private:
    float decayWeight = 0.0f;
    float current = 0.0f;
    std::atomic<float> level { 0.0f };
};
} // namespace interleaf
