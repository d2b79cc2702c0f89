#pragma once
#include <juce_core/juce_core.h>
#include "../config/PipelineConfig.h"
#include "MediaTypes.h"
#include "PipelineResult.h"
#include "FFmpegExecutor.h"
#include "DurationProber.h"

/**
 * Sums a prepared music track and a prepared voice track.
 *
 * Both inputs are expected to already carry their final gain and the target
 * length. The mix adds no gain of its own: amix runs with normalize=0 so the
 * inputs are not scaled by 1/N.
 */
class AudioMixer
{
public:
    AudioMixer(FFmpegExecutor& executor, DurationProber& prober, const PipelineConfig& config);

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    PipelineResult mix(const MediaTypes::MediaAsset& music,
                       const MediaTypes::MediaAsset& voice,
                       double targetDuration,
                       const juce::File& outputFile);

    static juce::String buildFilterGraph();

private:
    FFmpegExecutor& executor;
    DurationProber& prober;
    const PipelineConfig& config;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AudioMixer)
};
