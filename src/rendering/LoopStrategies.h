#pragma once
#include <juce_core/juce_core.h>
#include "../config/PipelineConfig.h"
#include "FFmpegExecutor.h"

/**
 * One way of making FFmpeg replay a video until it reaches a target length.
 *
 * Every strategy re-encodes to the canonical profile, drops the source audio
 * and caps the output at the target duration. The reconciler tries its
 * strategies in order and keeps the first output that succeeds.
 */
class LoopStrategy
{
public:
    virtual ~LoopStrategy() = default;

    /** Short name used in logs and error diagnostics. */
    virtual juce::String getName() const = 0;

    /**
     * Builds the complete argument list.
     * @param extras Number of additional plays beyond the first (>= 1)
     */
    virtual juce::StringArray buildCommand(const FFmpegExecutor& executor,
                                           const juce::File& source,
                                           double targetDuration,
                                           int extras,
                                           const VideoProfile& profile,
                                           const juce::File& output) const = 0;
};

/**
 * Replays the single input with -stream_loop inside one invocation.
 */
class StreamLoopStrategy : public LoopStrategy
{
public:
    juce::String getName() const override { return "stream-loop"; }

    juce::StringArray buildCommand(const FFmpegExecutor& executor,
                                   const juce::File& source,
                                   double targetDuration,
                                   int extras,
                                   const VideoProfile& profile,
                                   const juce::File& output) const override;
};

/**
 * Splits the decoded input into N copies and concatenates them in a filter graph.
 * Used when the demuxer refuses -stream_loop for a file.
 */
class SplitConcatStrategy : public LoopStrategy
{
public:
    juce::String getName() const override { return "split-concat"; }

    juce::StringArray buildCommand(const FFmpegExecutor& executor,
                                   const juce::File& source,
                                   double targetDuration,
                                   int extras,
                                   const VideoProfile& profile,
                                   const juce::File& output) const override;

    /** "[0:v]split=N[v0]..[vN-1];[v0]..[vN-1]concat=n=N:v=1:a=0[cat]" */
    static juce::String buildFilterGraph(int copies);
};
