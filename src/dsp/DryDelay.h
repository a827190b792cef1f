#pragma once

#include <array>
#include <JuceHeader.h>

namespace interleaf
{
// Integer sample delay for lining the dry path up with oversampling latency.
class DryDelay
{
public:
    static constexpr int kMaxDelaySamples = 255;

    // Clamped to [0, kMaxDelaySamples]; recorded history survives a change.
    void setDelaySamples(int samples);
    int getDelaySamples() const { return delaySamples; }
    void reset();

    float processSample(float x);

private:
    std::array<float, kMaxDelaySamples + 1> line {};
    int writePos = 0;
    int delaySamples = 0;
};
} // namespace interleaf
