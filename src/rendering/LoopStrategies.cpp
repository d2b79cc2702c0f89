#include "LoopStrategies.h"

juce::StringArray StreamLoopStrategy::buildCommand(const FFmpegExecutor& executor,
                                                   const juce::File& source,
                                                   double targetDuration,
                                                   int extras,
                                                   const VideoProfile& profile,
                                                   const juce::File& output) const
{
    juce::StringArray args = executor.createFFmpegCommand();
    args.add("-stream_loop");
    args.add(juce::String(juce::jmax(0, extras)));
    args.add("-i");
    args.add(FFmpegExecutor::toCommandPath(source));
    args.add("-t");
    args.add(FFmpegExecutor::formatSeconds(targetDuration));
    args.add("-an");                               // Source audio never reaches the mix
    args.addArray(profile.toArguments());
    args.add(FFmpegExecutor::toCommandPath(output));
    return args;
}

//==============================================================================
juce::String SplitConcatStrategy::buildFilterGraph(int copies)
{
    copies = juce::jmax(2, copies);

    juce::String labels;
    for (int i = 0; i < copies; ++i)
        labels << "[v" << i << "]";

    juce::String graph;
    graph << "[0:v]split=" << copies << labels << ";"
          << labels << "concat=n=" << copies << ":v=1:a=0[cat]";
    return graph;
}

juce::StringArray SplitConcatStrategy::buildCommand(const FFmpegExecutor& executor,
                                                    const juce::File& source,
                                                    double targetDuration,
                                                    int extras,
                                                    const VideoProfile& profile,
                                                    const juce::File& output) const
{
    // One copy per play, so the concatenation is long enough to cover the target
    const int copies = juce::jmax(2, extras + 1);

    juce::StringArray args = executor.createFFmpegCommand();
    args.add("-i");
    args.add(FFmpegExecutor::toCommandPath(source));
    args.add("-filter_complex");
    args.add(buildFilterGraph(copies));
    args.add("-map");
    args.add("[cat]");
    args.add("-t");
    args.add(FFmpegExecutor::formatSeconds(targetDuration));
    args.add("-an");
    args.addArray(profile.toArguments());
    args.add(FFmpegExecutor::toCommandPath(output));
    return args;
}
