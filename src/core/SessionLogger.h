#pragma once
#include <juce_core/juce_core.h>

/**
 * A juce::Logger that appends timestamped lines to a session file and passes
 * each message on to the logger that was installed before it.
 *
 * With no previous logger the message goes to Logger::outputDebugString, so a
 * console run still prints it.
 */
class SessionLogger : public juce::Logger
{
public:
    SessionLogger(const juce::File& destination, juce::Logger* previousLogger);
    ~SessionLogger() override;

    void logMessage(const juce::String& message) override;

    const juce::File& getLogFile() const noexcept { return logFile; }

    /**
     * Creates <root>/<prefix>_<YYYYmmdd_HHMMSS>, adding a suffix if a directory
     * for the same second already exists.
     */
    static juce::File createTimestampedDirectory(const juce::File& root, const juce::String& prefix);

private:
    juce::Logger* previous = nullptr;
    juce::File logFile;
    std::unique_ptr<juce::FileOutputStream> fileStream;
    juce::CriticalSection writeLock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SessionLogger)
};
