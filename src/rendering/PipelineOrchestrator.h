#pragma once
#include <juce_core/juce_core.h>
#include "../config/PipelineConfig.h"
#include "MediaTypes.h"
#include "PipelineResult.h"
#include "FFmpegExecutor.h"
#include "DurationProber.h"
#include "VideoReconciler.h"
#include "VoicePadder.h"
#include "BackgroundTrackLooper.h"
#include "AudioMixer.h"

/**
 * Coordinates the duration pipeline for one output at a time.
 * Delegates the actual work to the specialised components.
 *
 * Every entry point blocks until done. Intermediate files are kept in a
 * scratch directory beside the output that is removed on every exit path.
 * cancel() may be called from another thread; it takes effect before the
 * next step starts.
 */
class PipelineOrchestrator
{
public:
    enum class PipelineState
    {
        Idle,
        PreparingVideo,
        PaddingVoice,
        PreparingMusic,
        Mixing,
        Completed,
        Failed,
        Cancelled
    };

    PipelineOrchestrator(FFmpegExecutor& executor, const PipelineConfig& config);
    ~PipelineOrchestrator();

    /**
     * Sets a callback for progress messages.
     * Messages are also written to the current juce::Logger.
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /** Loops or trims a video so that it runs for audioDuration seconds. */
    PipelineResult prepareVideoForAudio(const MediaTypes::MediaAsset& video,
                                        double audioDuration,
                                        const juce::File& outputFile);

    /**
     * Builds the soundtrack for one clip: the voice delayed and padded to the
     * target, the music looped, attenuated and faded to the target, then both
     * summed. Without a voice asset the prepared music is the result.
     */
    PipelineResult mixVoiceAndMusic(const MediaTypes::MediaAsset& voice,
                                    const MediaTypes::MediaAsset& music,
                                    const MediaTypes::TargetSpec& spec,
                                    const juce::File& outputFile);

    /** Requests that the running operation stops before its next step. */
    void cancel() noexcept { shouldCancel = true; }

    PipelineState getState() const noexcept { return state.load(); }

    static juce::String getStateName(PipelineState state);

    VideoReconciler& getVideoReconciler() noexcept          { return *videoReconciler; }
    VoicePadder& getVoicePadder() noexcept                  { return *voicePadder; }
    BackgroundTrackLooper& getBackgroundTrackLooper() noexcept { return *backgroundLooper; }
    AudioMixer& getAudioMixer() noexcept                    { return *audioMixer; }
    DurationProber& getDurationProber() noexcept            { return *prober; }

private:
    juce::Result validate(const MediaTypes::TargetSpec& spec) const;
    bool checkCancelled(PipelineResult& result);
    PipelineResult finish(PipelineResult result);
    void updateState(PipelineState newState);
    void log(const juce::String& message);

    const PipelineConfig& config;

    // Component instances
    std::unique_ptr<DurationProber> prober;
    std::unique_ptr<VideoReconciler> videoReconciler;
    std::unique_ptr<VoicePadder> voicePadder;
    std::unique_ptr<BackgroundTrackLooper> backgroundLooper;
    std::unique_ptr<AudioMixer> audioMixer;

    std::function<void(const juce::String&)> logCallback;

    std::atomic<PipelineState> state { PipelineState::Idle };
    std::atomic<bool> shouldCancel { false };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PipelineOrchestrator)
};
