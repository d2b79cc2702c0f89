#pragma once
#include <juce_core/juce_core.h>
#include "../config/PipelineConfig.h"
#include "MediaTypes.h"
#include "PipelineResult.h"
#include "FFmpegExecutor.h"
#include "DurationProber.h"

/**
 * Fits a background music track to a target length.
 *
 * A track shorter than the target is repeated through the concat demuxer
 * (a lossless copy) and cut at the target. A longer track is used directly.
 * The music gain and the closing fade-out are then applied in a single
 * encode, so this is the only place the music level is set.
 */
class BackgroundTrackLooper
{
public:
    BackgroundTrackLooper(FFmpegExecutor& executor, DurationProber& prober, const PipelineConfig& config);

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * @param music          The source track
     * @param targetDuration Exact output length in seconds
     * @param musicVolume    Linear gain, 0..1
     * @param outputFile     Destination, replaced only on success
     * @param fadeDuration   Fade-out window in seconds, or negative for the configured one
     */
    PipelineResult prepareBackground(const MediaTypes::MediaAsset& music,
                                     double targetDuration,
                                     double musicVolume,
                                     const juce::File& outputFile,
                                     double fadeDuration = -1.0);

    /** Number of times a track of the given length is listed to cover the target */
    static int getNumRepeats(double musicDuration, double targetDuration);

    /** Playlist text with one "file '<path>'" line per repeat */
    static juce::String buildPlaylist(const juce::File& music, int repeats);

    /** "volume=V,afade=t=out:st=S:d=D" */
    static juce::String buildFadeFilter(double musicVolume, double targetDuration, double fadeDuration);

private:
    juce::Result loopToLength(const juce::File& music, int repeats, double targetDuration,
                              const juce::File& playlistFile, const juce::File& loopedFile);

    void log(const juce::String& message);

    FFmpegExecutor& executor;
    DurationProber& prober;
    const PipelineConfig& config;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(BackgroundTrackLooper)
};
