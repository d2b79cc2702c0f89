#pragma once
#include <juce_core/juce_core.h>

//==============================================================================
/**
 * @file FFmpegExecutor.h
 *
 * This file declares the FFmpegExecutor class which is responsible for running
 * FFmpeg and FFprobe as child processes and collecting what they print.
 *
 * The class handles:
 * - Locating the FFmpeg/FFprobe executables
 * - Running an argument list and capturing exit code and combined output
 * - Per-command and aggregate session log files
 * - Checking for FFmpeg availability
 */

/**
 * The result of one finished child process.
 */
struct CommandOutcome
{
    bool started = false;   // false when the executable could not be launched
    int exitCode = -1;
    juce::String output;    // stdout and stderr, decoded as UTF-8

    bool succeeded() const noexcept { return started && exitCode == 0; }

    /**
     * The last part of the output, which is where FFmpeg reports the actual
     * error after its stream summary.
     */
    juce::String getDiagnosticTail(int maxCharacters = 2000) const;
};

//==============================================================================
/**
 * The FFmpegExecutor class handles all interaction with FFmpeg as an external process.
 *
 * Commands are passed as argument lists (the executable first), never as a
 * single shell string, so paths with spaces or quotes need no escaping.
 * Each call blocks until the process exits. There is no timeout.
 *
 * @note This class doesn't interpret media - it only runs commands and reports
 *       results. The duration logic lives in the components that use it.
 */
class FFmpegExecutor
{
public:
    /**
     * @param ffmpegOverride  Explicit path to ffmpeg, or empty to search
     * @param ffprobeOverride Explicit path to ffprobe, or empty to search
     */
    FFmpegExecutor(const juce::String& ffmpegOverride = {},
                   const juce::String& ffprobeOverride = {});

    virtual ~FFmpegExecutor();

    /**
     * Sets a callback function that will be called with log messages.
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Sets the directory where FFmpeg command output should be recorded.
     * A per-command log file plus an aggregate log will be created in this directory.
     * Pass juce::File() to disable.
     */
    void setSessionLogDirectory(const juce::File& directory);

    /**
     * Runs a command to completion and returns its exit code and output.
     * The output is also written to the session logs when enabled.
     *
     * @param arguments The executable followed by its arguments
     */
    CommandOutcome executeCommand(const juce::StringArray& arguments);

    /** Builds an FFmpeg argument list: executable plus the common leading flags. */
    juce::StringArray createFFmpegCommand() const;

    /** Builds an FFprobe argument list: executable plus "-v error". */
    juce::StringArray createFFprobeCommand() const;

    /**
     * Gets the path to the FFmpeg executable.
     *
     * @return The override, a copy next to the running executable, or "ffmpeg" for PATH lookup
     */
    juce::String getFFmpegPath() const;

    /**
     * Gets the path to the FFprobe executable.
     */
    juce::String getFFprobePath() const;

    /**
     * Checks if FFmpeg and FFprobe both start and report a version.
     */
    bool checkFFmpegAvailability();

    /** Converts a file to the path form passed on the command line (forward slashes). */
    static juce::String toCommandPath(const juce::File& file);

    /** Formats seconds with fixed millisecond precision, never in scientific notation. */
    static juce::String formatSeconds(double seconds);

protected:
    /**
     * Launches the process and blocks until it exits.
     * This is the only place that touches the operating system; tests override it.
     */
    virtual CommandOutcome runProcess(const juce::StringArray& arguments);

private:
    juce::File getNextCommandLogFile(int& outIndex);
    void writeToAggregateLog(const juce::String& message);
    void log(const juce::String& message);

    static juce::String locateExecutable(const juce::String& name);

    juce::String ffmpegPath;
    juce::String ffprobePath;

    /** Callback function for reporting log messages */
    std::function<void(const juce::String&)> logCallback;

    //==========================================================================
    // Logging helpers
    juce::CriticalSection logDirectoryLock;
    juce::File sessionLogDirectory;
    juce::File sessionAggregateLogFile;
    bool sessionLoggingEnabled { false };
    int sessionCommandIndex { 0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FFmpegExecutor)
};
