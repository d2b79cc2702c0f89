#pragma once
#include <juce_core/juce_core.h>
#include <cmath>
#include <limits>

/**
 * Common types used across the pipeline.
 * These types are shared by multiple components to ensure consistency.
 */
namespace MediaTypes
{
    enum class MediaKind
    {
        Video,
        Audio
    };

    /** A caller-owned media file. Duration is probed when needed, never cached here. */
    struct MediaAsset
    {
        juce::File file;
        MediaKind kind = MediaKind::Video;

        static MediaAsset video(const juce::File& f) { return { f, MediaKind::Video }; }
        static MediaAsset audio(const juce::File& f) { return { f, MediaKind::Audio }; }

        bool isEmpty() const { return file == juce::File(); }
    };

    /** Timing and gain for one voice + music mix */
    struct TargetSpec
    {
        double targetDuration = 0.0;   // Output length in seconds
        double voiceDelay = 1.0;       // Seconds of silence before the voice starts
        double voiceVolume = 1.0;      // Linear gain, 0..1
        double musicVolume = 0.15;     // Linear gain, 0..1
        double fadeDuration = 1.5;     // Music fade-out window at the end
    };

    /** What the reconciler does with a video of a given probed length */
    struct ReconciliationDecision
    {
        enum class Kind
        {
            AsIs,
            Loop,
            Trim
        };

        Kind kind = Kind::AsIs;
        int extras = 0;   // Additional plays beyond the first, only meaningful for Loop

        /**
         * Compares a probed duration against the target.
         * Both durations must be positive.
         */
        static ReconciliationDecision decide(double probedDuration,
                                             double targetDuration,
                                             double closenessTolerance)
        {
            ReconciliationDecision decision;

            if (std::abs(probedDuration - targetDuration) < closenessTolerance)
                return decision;

            if (probedDuration < targetDuration)
            {
                decision.kind = Kind::Loop;
                // Clamped before the cast; a tiny probe against a long target overflows int
                const double plays = juce::jlimit(1.0, (double) std::numeric_limits<int>::max(),
                                                  std::ceil(targetDuration / probedDuration));
                decision.extras = (int) plays - 1;
                return decision;
            }

            decision.kind = Kind::Trim;
            return decision;
        }
    };
}
