#pragma once

#include <JuceHeader.h>

namespace Logging
{
// Directory for log files; INTERLEAF_LOG_DIR overrides the app-data default.
juce::File getLogDirectory();

// Reference-counted shared file logger.
void startSharedLogger();
void stopSharedLogger();
juce::File getCurrentLogFile();

// Keeps the shared logger alive for the lifetime of the object.
struct ScopedLogger
{
    ScopedLogger() { startSharedLogger(); }
    ~ScopedLogger() { stopSharedLogger(); }

    JUCE_DECLARE_NON_COPYABLE(ScopedLogger)
};
} // namespace Logging
