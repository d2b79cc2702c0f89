#pragma once
#include <juce_core/juce_core.h>
#include "../config/PipelineConfig.h"
#include "FFmpegExecutor.h"
#include "DurationProber.h"

/**
 * Write-then-rename for FFmpeg outputs.
 *
 * The command must write to temp.getFile(). When it exits cleanly and left a
 * non-empty file (and, with verification enabled, the file has the expected
 * length and audio layout) the temporary is moved over temp's target.
 * Otherwise the target is left as it was and the TemporaryFile deletes the
 * partial output when it goes out of scope.
 */
namespace OutputCommit
{
    struct Expectations
    {
        double duration = -1.0;        // < 0 skips the duration check
        bool requireNoAudio = false;
    };

    /**
     * @param failureReason Receives the reason and FFmpeg's diagnostic output on failure
     */
    bool runAndCommit(FFmpegExecutor& executor,
                      DurationProber& prober,
                      const PipelineConfig& config,
                      const juce::StringArray& command,
                      juce::TemporaryFile& temp,
                      const Expectations& expectations,
                      juce::String& failureReason);
}
