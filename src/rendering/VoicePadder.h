#pragma once
#include <juce_core/juce_core.h>
#include "../config/PipelineConfig.h"
#include "MediaTypes.h"
#include "PipelineResult.h"
#include "FFmpegExecutor.h"
#include "DurationProber.h"

/**
 * Places a narration track on a timeline of fixed length.
 *
 * The output is silence for startDelay seconds, then the voice at the given
 * gain, then silence up to totalDuration. A voice that would run past
 * totalDuration is cut off there.
 */
class VoicePadder
{
public:
    VoicePadder(FFmpegExecutor& executor, DurationProber& prober, const PipelineConfig& config);

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * @param voice         The narration file
     * @param startDelay    Seconds of leading silence, >= 0
     * @param totalDuration Exact output length in seconds, > 0
     * @param volume        Linear gain applied to the voice, 0..1. This is the only
     *                      place the voice gain is applied.
     * @param outputFile    Destination, replaced only on success
     */
    PipelineResult pad(const MediaTypes::MediaAsset& voice,
                       double startDelay,
                       double totalDuration,
                       double volume,
                       const juce::File& outputFile);

    /** "volume=V,adelay=D:all=1,apad=whole_dur=T" */
    static juce::String buildFilterChain(double startDelay, double totalDuration, double volume);

private:
    FFmpegExecutor& executor;
    DurationProber& prober;
    const PipelineConfig& config;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(VoicePadder)
};
