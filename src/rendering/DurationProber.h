#pragma once
#include <juce_core/juce_core.h>
#include "FFmpegExecutor.h"

/**
 * Asks FFprobe about a media file.
 *
 * Nothing is cached: every call runs FFprobe again, so a file that changes on
 * disk between steps is always measured as it is now.
 */
class DurationProber
{
public:
    explicit DurationProber(FFmpegExecutor& executor);

    /**
     * Reads the container-level duration.
     *
     * Fails when FFprobe exits nonzero, prints nothing, prints something that is
     * not a number, or reports a duration that is not positive. A failed probe
     * leaves durationSeconds untouched; it is never reported as 0.0.
     */
    juce::Result probeDuration(const juce::File& file, double& durationSeconds);

    /** Counts the audio streams in the file. */
    juce::Result countAudioStreams(const juce::File& file, int& numAudioStreams);

    /**
     * Probes an output and checks it against the duration it was meant to have.
     */
    juce::Result verifyDuration(const juce::File& file, double expectedSeconds, double tolerance);

    /** Parses FFprobe's single-value output. Exposed for tests. */
    static bool parseDuration(const juce::String& text, double& durationSeconds);

private:
    FFmpegExecutor& executor;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(DurationProber)
};
