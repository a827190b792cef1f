#include "RenderLength.h"
#include <limits>

namespace interleaf
{
juce::Result computeRenderLength(juce::int64 inputLength, int latencySamples, int& bufferLength)
{
    if (inputLength <= 0)
        return juce::Result::fail("input has no samples");

    if (latencySamples < 0)
        return juce::Result::fail("negative latency: " + juce::String(latencySamples));

    const auto total = inputLength + static_cast<juce::int64>(latencySamples);
    if (total > static_cast<juce::int64>(std::numeric_limits<int>::max()))
        return juce::Result::fail("input too long: " + juce::String(inputLength) + " samples");

    bufferLength = static_cast<int>(total);
    return juce::Result::ok();
}
} // namespace interleaf
