#pragma once

#include <JuceHeader.h>

namespace Version
{
inline juce::String versionString()
{
#if defined(INTERLEAF_VERSION)
    return INTERLEAF_VERSION;
#else
    return "0.0.0";
#endif
}

inline juce::String displayString()
{
    return "Interleaf v" + versionString();
}
} // namespace Version
