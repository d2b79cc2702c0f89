//==============================================================================
/**
 * @file FFmpegExecutor.cpp
 *
 * Implementation file for the FFmpegExecutor class, which runs FFmpeg/FFprobe
 * as external processes and records what they print.
 *
 * Output is read as raw bytes and decoded explicitly as UTF-8, since FFmpeg
 * echoes file names and metadata that are frequently non-ASCII.
 */

#include "FFmpegExecutor.h"
#include "../core/ProcessRegistry.h"

namespace
{
    juce::String decodeUTF8(const juce::MemoryOutputStream& stream)
    {
        if (stream.getDataSize() == 0)
            return {};

        return juce::String::fromUTF8(static_cast<const char*>(stream.getData()),
                                      (int) stream.getDataSize());
    }

    juce::String quoteForLog(const juce::StringArray& arguments)
    {
        juce::StringArray quoted;

        for (const auto& arg : arguments)
            quoted.add(arg.containsAnyOf(" \t'\";|") ? arg.quoted() : arg);

        return quoted.joinIntoString(" ");
    }
}

//==============================================================================
juce::String CommandOutcome::getDiagnosticTail(int maxCharacters) const
{
    juce::String text = output.trim();

    if (!started && text.isEmpty())
        return "Process could not be started";

    if (text.length() > maxCharacters)
        text = "..." + text.getLastCharacters(maxCharacters);

    return "exit code " + juce::String(exitCode) + (text.isNotEmpty() ? "\n" + text : juce::String());
}

//==============================================================================
FFmpegExecutor::FFmpegExecutor(const juce::String& ffmpegOverride, const juce::String& ffprobeOverride)
    : ffmpegPath(ffmpegOverride.trim().isNotEmpty() ? ffmpegOverride.trim() : locateExecutable("ffmpeg")),
      ffprobePath(ffprobeOverride.trim().isNotEmpty() ? ffprobeOverride.trim() : locateExecutable("ffprobe"))
{
}

FFmpegExecutor::~FFmpegExecutor()
{
}

//==============================================================================
void FFmpegExecutor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void FFmpegExecutor::log(const juce::String& message)
{
    if (logCallback)
        logCallback(message);
}

//==============================================================================
void FFmpegExecutor::setSessionLogDirectory(const juce::File& directory)
{
    juce::ScopedLock sl(logDirectoryLock);

    sessionLoggingEnabled = false;
    sessionLogDirectory = juce::File();
    sessionAggregateLogFile = juce::File();
    sessionCommandIndex = 0;

    if (directory == juce::File())
        return;

    if (!directory.isDirectory() && !directory.createDirectory().wasOk())
        return;

    sessionLogDirectory = directory;
    sessionAggregateLogFile = sessionLogDirectory.getChildFile("ffmpeg.log");
    sessionLoggingEnabled = true;
}

//==============================================================================
juce::File FFmpegExecutor::getNextCommandLogFile(int& outIndex)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
    {
        outIndex = -1;
        return juce::File();
    }

    ++sessionCommandIndex;
    outIndex = sessionCommandIndex;
    return sessionLogDirectory.getNonexistentChildFile(juce::String::formatted("ffmpeg_%03d", outIndex), ".log", false);
}

//==============================================================================
void FFmpegExecutor::writeToAggregateLog(const juce::String& message)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
        return;

    juce::FileOutputStream stream(sessionAggregateLogFile, 1024);
    if (stream.openedOk())
        stream.writeText(message + "\n", false, false, nullptr);
}

//==============================================================================
CommandOutcome FFmpegExecutor::executeCommand(const juce::StringArray& arguments)
{
    jassert(!arguments.isEmpty());

    const juce::String commandLine = quoteForLog(arguments);
    const juce::String startTimeString = juce::Time::getCurrentTime().toString(true, true);

    int commandLogIndex = -1;
    const juce::File commandLogFile = getNextCommandLogFile(commandLogIndex);
    const juce::String commandIndexLabel = (commandLogIndex > 0)
        ? juce::String::formatted("#%03d", commandLogIndex)
        : juce::String("#---");

    writeToAggregateLog(commandIndexLabel + " [" + startTimeString + "] START " + commandLine);
    log("Running: " + commandLine);

    const CommandOutcome outcome = runProcess(arguments);

    const juce::String finishTimeString = juce::Time::getCurrentTime().toString(true, true);

    if (commandLogFile != juce::File())
    {
        juce::FileOutputStream stream(commandLogFile);
        if (stream.openedOk())
        {
            stream.writeText("Started: " + startTimeString + "\n", false, false, nullptr);
            stream.writeText("Command: " + commandLine + "\n", false, false, nullptr);
            stream.writeText("------------------------------------------------------------\n", false, false, nullptr);
            stream.writeText(outcome.output.replace("\r", "\n"), false, false, nullptr);
            stream.writeText("\n------------------------------------------------------------\n", false, false, nullptr);
            stream.writeText("Finished: " + finishTimeString + "\n", false, false, nullptr);
            stream.writeText(outcome.started ? "Exit code: " + juce::String(outcome.exitCode) + "\n"
                                             : juce::String("Failed to start process\n"),
                             false, false, nullptr);
            stream.flush();
        }
    }

    if (!outcome.started)
    {
        writeToAggregateLog(commandIndexLabel + " [" + finishTimeString + "] START_FAILED");
        log("ERROR: Failed to start " + arguments[0]);
        return outcome;
    }

    writeToAggregateLog(commandIndexLabel + " [" + finishTimeString + "] END exitCode=" + juce::String(outcome.exitCode));

    if (outcome.exitCode != 0)
    {
        log("FFmpeg error (exit code: " + juce::String(outcome.exitCode) + ")");
        if (outcome.output.containsIgnoreCase("No space left on device"))
            log("No space left on device");
    }

    return outcome;
}

//==============================================================================
CommandOutcome FFmpegExecutor::runProcess(const juce::StringArray& arguments)
{
    CommandOutcome outcome;

    RegisteredChildProcess process(arguments[0].fromLastOccurrenceOf("/", false, false));

    if (!process.start(arguments, juce::ChildProcess::wantStdOut | juce::ChildProcess::wantStdErr))
        return outcome;

    outcome.started = true;

    // Drain the pipe while the process runs, otherwise a chatty encoder blocks on a full pipe
    juce::MemoryOutputStream captured;
    char buffer[4096];

    for (;;)
    {
        const int bytesRead = process.readProcessOutput(buffer, (int) sizeof(buffer));

        if (bytesRead > 0)
        {
            captured.write(buffer, (size_t) bytesRead);
            continue;
        }

        if (!process.isRunning())
            break;

        juce::Thread::sleep(10);
    }

    process.waitForProcessToFinish(-1);

    outcome.exitCode = (int) process.getExitCode();
    outcome.output = decodeUTF8(captured);
    return outcome;
}

//==============================================================================
juce::StringArray FFmpegExecutor::createFFmpegCommand() const
{
    juce::StringArray args;
    args.add(getFFmpegPath());
    args.add("-y");              // Overwrite output
    args.add("-nostdin");
    args.add("-hide_banner");
    return args;
}

juce::StringArray FFmpegExecutor::createFFprobeCommand() const
{
    juce::StringArray args;
    args.add(getFFprobePath());
    args.add("-v");
    args.add("error");
    return args;
}

juce::String FFmpegExecutor::getFFmpegPath() const
{
    return ffmpegPath;
}

juce::String FFmpegExecutor::getFFprobePath() const
{
    return ffprobePath;
}

//==============================================================================
juce::String FFmpegExecutor::locateExecutable(const juce::String& name)
{
   #if JUCE_WINDOWS
    const juce::String fileName = name + ".exe";
   #else
    const juce::String fileName = name;
   #endif

    // Prefer a copy shipped next to our executable
    const juce::File appDir = juce::File::getSpecialLocation(juce::File::currentExecutableFile).getParentDirectory();
    const juce::File local = appDir.getChildFile(fileName);

    if (local.existsAsFile())
        return local.getFullPathName();

    // Fallback to system PATH
    return fileName;
}

//==============================================================================
bool FFmpegExecutor::checkFFmpegAvailability()
{
    juce::StringArray ffmpegArgs;
    ffmpegArgs.add(getFFmpegPath());
    ffmpegArgs.add("-version");

    auto ffmpegVersion = runProcess(ffmpegArgs);
    if (!ffmpegVersion.succeeded())
    {
        log("FFmpeg not available at " + getFFmpegPath());
        return false;
    }

    juce::StringArray ffprobeArgs;
    ffprobeArgs.add(getFFprobePath());
    ffprobeArgs.add("-version");

    auto ffprobeVersion = runProcess(ffprobeArgs);
    if (!ffprobeVersion.succeeded())
    {
        log("FFprobe not available at " + getFFprobePath());
        return false;
    }

    log(ffmpegVersion.output.upToFirstOccurrenceOf("\n", false, false).trim());
    return true;
}

//==============================================================================
juce::String FFmpegExecutor::toCommandPath(const juce::File& file)
{
    return file.getFullPathName().replaceCharacter('\\', '/');
}

juce::String FFmpegExecutor::formatSeconds(double seconds)
{
    return juce::String(seconds, 3);
}
