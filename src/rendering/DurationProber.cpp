#include "DurationProber.h"
#include <cmath>
#include <cstdlib>

DurationProber::DurationProber(FFmpegExecutor& executor)
    : executor(executor)
{
}

bool DurationProber::parseDuration(const juce::String& text, double& durationSeconds)
{
    const juce::String value = text.trim();

    if (value.isEmpty() || !value.containsOnly("0123456789.eE+-"))
        return false;

    if (!value.containsAnyOf("0123456789"))
        return false;

    // The whole string has to be one number, "1.2.3" or "3e" are rejected
    const char* const start = value.toRawUTF8();
    char* end = nullptr;
    const double parsed = std::strtod(start, &end);

    if (end == start || *end != '\0')
        return false;

    if (!std::isfinite(parsed) || parsed <= 0.0)
        return false;

    durationSeconds = parsed;
    return true;
}

juce::Result DurationProber::probeDuration(const juce::File& file, double& durationSeconds)
{
    if (!file.existsAsFile())
        return juce::Result::fail("Cannot probe missing file: " + file.getFullPathName());

    juce::StringArray args = executor.createFFprobeCommand();
    args.add("-show_entries");
    args.add("format=duration");
    args.add("-of");
    args.add("csv=p=0");
    args.add(FFmpegExecutor::toCommandPath(file));

    const CommandOutcome outcome = executor.executeCommand(args);

    if (!outcome.succeeded())
        return juce::Result::fail("Duration probe failed for " + file.getFileName() + ": "
                                  + outcome.getDiagnosticTail());

    if (!parseDuration(outcome.output, durationSeconds))
        return juce::Result::fail("Duration probe for " + file.getFileName()
                                  + " returned no usable duration: \"" + outcome.output.trim() + "\"");

    return juce::Result::ok();
}

juce::Result DurationProber::countAudioStreams(const juce::File& file, int& numAudioStreams)
{
    if (!file.existsAsFile())
        return juce::Result::fail("Cannot probe missing file: " + file.getFullPathName());

    juce::StringArray args = executor.createFFprobeCommand();
    args.add("-select_streams");
    args.add("a");
    args.add("-show_entries");
    args.add("stream=index");
    args.add("-of");
    args.add("csv=p=0");
    args.add(FFmpegExecutor::toCommandPath(file));

    const CommandOutcome outcome = executor.executeCommand(args);

    if (!outcome.succeeded())
        return juce::Result::fail("Stream probe failed for " + file.getFileName() + ": "
                                  + outcome.getDiagnosticTail());

    juce::StringArray lines;
    lines.addLines(outcome.output);
    lines.trim();
    lines.removeEmptyStrings();

    // One index per audio stream
    for (const auto& line : lines)
    {
        if (!line.containsOnly("0123456789,"))
            return juce::Result::fail("Unexpected stream probe output for " + file.getFileName()
                                      + ": \"" + line + "\"");
    }

    numAudioStreams = lines.size();
    return juce::Result::ok();
}

juce::Result DurationProber::verifyDuration(const juce::File& file, double expectedSeconds, double tolerance)
{
    double actual = 0.0;
    const juce::Result probe = probeDuration(file, actual);

    if (probe.failed())
        return probe;

    if (std::abs(actual - expectedSeconds) > tolerance)
        return juce::Result::fail(file.getFileName() + " is " + juce::String(actual, 3)
                                  + "s, expected " + juce::String(expectedSeconds, 3)
                                  + "s (tolerance " + juce::String(tolerance, 3) + "s)");

    return juce::Result::ok();
}
