#include "Logging.h"
#include "Version.h"
#include <atomic>
#include <memory>

namespace
{
juce::File makeLogFile()
{
    const auto now = juce::Time::getCurrentTime();
    const juce::String name = "Interleaf_" + now.formatted("%Y-%m-%d_%H-%M-%S") + ".log";
    return Logging::getLogDirectory().getChildFile(name);
}

std::atomic<int> gLoggerUsers { 0 };
std::unique_ptr<juce::FileLogger> gSharedLogger;
juce::File gSharedLogFile;
juce::CriticalSection gLoggerLock;
} // namespace

namespace Logging
{
juce::File getLogDirectory()
{
    const auto overrideDir = juce::SystemStats::getEnvironmentVariable("INTERLEAF_LOG_DIR", {});
    if (overrideDir.isNotEmpty() && juce::File::isAbsolutePath(overrideDir))
    {
        juce::File dir(overrideDir);
        dir.createDirectory();
        return dir;
    }

    auto dir = juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
                   .getChildFile("Interleaf")
                   .getChildFile("Logs");
    dir.createDirectory();
    return dir;
}

void startSharedLogger()
{
    const juce::ScopedLock lock(gLoggerLock);
    if (gLoggerUsers.fetch_add(1) == 0)
    {
        gSharedLogFile = makeLogFile();
        gSharedLogger = std::make_unique<juce::FileLogger>(gSharedLogFile, "Interleaf log", 0);
        juce::Logger::setCurrentLogger(gSharedLogger.get());
        juce::Logger::writeToLog("Log file: " + gSharedLogFile.getFullPathName());
        juce::Logger::writeToLog("Version: " + Version::displayString());
    }
}

void stopSharedLogger()
{
    const juce::ScopedLock lock(gLoggerLock);
    if (gLoggerUsers.load() <= 0)
        return;

    if (gLoggerUsers.fetch_sub(1) == 1)
    {
        juce::Logger::writeToLog("Log closed.");
        juce::Logger::setCurrentLogger(nullptr);
        gSharedLogger.reset();
        gSharedLogFile = juce::File();
    }
}

juce::File getCurrentLogFile()
{
    const juce::ScopedLock lock(gLoggerLock);
    return gSharedLogFile;
}
} // namespace Logging
