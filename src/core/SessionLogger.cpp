#include "SessionLogger.h"

SessionLogger::SessionLogger(const juce::File& destination, juce::Logger* previousLogger)
    : previous(previousLogger), logFile(destination)
{
    if (logFile.existsAsFile())
        logFile.deleteFile();
    logFile.create();

    fileStream = std::make_unique<juce::FileOutputStream>(logFile);
    if (fileStream->openedOk())
    {
        fileStream->writeText("Session log started at " + juce::Time::getCurrentTime().toString(true, true) + "\n",
                              false, false, nullptr);
        fileStream->flush();
    }
    else
    {
        fileStream.reset();
    }
}

SessionLogger::~SessionLogger()
{
    const juce::ScopedLock lock(writeLock);
    if (fileStream != nullptr)
        fileStream->flush();
}

void SessionLogger::logMessage(const juce::String& message)
{
    {
        const juce::ScopedLock lock(writeLock);
        if (fileStream != nullptr)
        {
            fileStream->writeText(juce::Time::getCurrentTime().toString(true, true) + " | " + message + "\n",
                                  false, false, nullptr);
            fileStream->flush();
        }
    }

    if (previous == nullptr)
    {
        juce::Logger::outputDebugString(message);
        return;
    }

    // logMessage() is protected, so route through writeToLog with the previous logger current
    juce::Logger* current = juce::Logger::getCurrentLogger();

    if (current != previous)
        juce::Logger::setCurrentLogger(previous);

    juce::Logger::writeToLog(message);

    if (current != previous)
        juce::Logger::setCurrentLogger(current);
}

juce::File SessionLogger::createTimestampedDirectory(const juce::File& root, const juce::String& prefix)
{
    const juce::String timestamp = juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S");
    juce::File sessionDir = root.getNonexistentChildFile(prefix + "_" + timestamp, {}, false);

    if (sessionDir.createDirectory().failed())
        return {};

    return sessionDir;
}
