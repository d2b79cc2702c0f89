#pragma once
#include <juce_core/juce_core.h>
#include "../config/PipelineConfig.h"
#include "MediaTypes.h"
#include "PipelineResult.h"
#include "FFmpegExecutor.h"
#include "DurationProber.h"
#include "LoopStrategies.h"
#include "OutputCommit.h"

/**
 * Makes a background video exactly as long as a target duration.
 *
 * A video within the closeness tolerance of the target is used as it is.
 * A shorter one is looped, a longer one trimmed; both re-encode to the
 * canonical profile without audio. Encodes go to a temporary sibling of the
 * output file, which replaces the output only when the encode succeeded.
 */
class VideoReconciler
{
public:
    /**
     * Creates a reconciler with the default strategy order: stream-loop, then split-concat.
     */
    VideoReconciler(FFmpegExecutor& executor, DurationProber& prober, const PipelineConfig& config);
    ~VideoReconciler();

    /**
     * Sets a callback for receiving log messages.
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /** Replaces the loop strategies. They are tried in the given order. */
    void setLoopStrategies(std::vector<std::unique_ptr<LoopStrategy>> strategies);

    const std::vector<std::unique_ptr<LoopStrategy>>& getLoopStrategies() const { return loopStrategies; }

    /**
     * Reconciles the video with the target duration.
     *
     * @param video          The source video. Never modified or deleted.
     * @param targetDuration Required length in seconds, > 0
     * @param outputFile     Where a looped/trimmed video is written
     * @return The file to use: outputFile, or the source itself when it was close enough
     *         and carries no audio
     */
    PipelineResult reconcile(const MediaTypes::MediaAsset& video,
                             double targetDuration,
                             const juce::File& outputFile);

private:
    PipelineResult passThrough(const MediaTypes::MediaAsset& video, const juce::File& outputFile);
    PipelineResult loop(const MediaTypes::MediaAsset& video, double targetDuration, int extras, const juce::File& outputFile);
    PipelineResult trim(const MediaTypes::MediaAsset& video, double targetDuration, const juce::File& outputFile);

    bool commit(const juce::StringArray& command,
                juce::TemporaryFile& temp,
                double expectedDuration,
                juce::String& failureReason);

    void log(const juce::String& message);

    FFmpegExecutor& executor;
    DurationProber& prober;
    const PipelineConfig& config;

    std::vector<std::unique_ptr<LoopStrategy>> loopStrategies;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(VideoReconciler)
};
