#pragma once
#include <juce_core/juce_core.h>
#include <juce_data_structures/juce_data_structures.h>

/**
 * Encoding profile used whenever a video is re-encoded (loop or trim).
 */
struct VideoProfile
{
    int frameRate = 30;
    juce::String pixelFormat = "yuv420p";
    juce::String videoCodec = "libx264";
    juce::String preset = "veryfast";
    int crf = 18;
    bool fastStart = true;

    /** The encoder flags in FFmpeg argument order, without input or output. */
    juce::StringArray toArguments() const;
};

/**
 * All tunables of the pipeline.
 *
 * Stored on disk as an XML ValueTree of type "QuoteClipConfig". Properties that
 * are missing from a file keep their default values.
 */
struct PipelineConfig
{
    //==========================================================================
    // External tools. Empty means "look next to the executable, then on PATH".
    juce::String ffmpegPath;
    juce::String ffprobePath;

    //==========================================================================
    // Duration arithmetic
    double closenessTolerance = 1.0;   // Videos this close to the target are used as-is
    double durationTolerance = 0.05;   // Allowed container/frame rounding on outputs
    double fadeDuration = 1.5;         // Music fade-out window

    VideoProfile videoProfile;

    //==========================================================================
    // Defaults for a mix when the caller does not override them
    double defaultVoiceDelay = 1.0;
    double defaultVoiceVolume = 1.0;
    double defaultMusicVolume = 0.15;

    //==========================================================================
    // Behaviour
    juce::String scratchDirectoryName = ".quoteclip_work";
    bool stripAudioInPassThrough = true;
    bool verifyOutputDurations = false;

    /** Directory for per-command FFmpeg logs. Empty disables them. */
    juce::File logDirectory;

    //==========================================================================
    juce::ValueTree toValueTree() const;
    static PipelineConfig fromValueTree(const juce::ValueTree& tree);

    /** Reads an XML config file. On failure the target is left untouched. */
    static juce::Result loadFromFile(const juce::File& file, PipelineConfig& target);
    juce::Result saveToFile(const juce::File& file) const;

    /** Rejects values that would break the duration arithmetic. */
    juce::Result validate() const;

    static const juce::Identifier treeType;
};
