#include "VoicePadder.h"
#include <cmath>
#include "OutputCommit.h"

VoicePadder::VoicePadder(FFmpegExecutor& executor, DurationProber& prober, const PipelineConfig& config)
    : executor(executor),
      prober(prober),
      config(config)
{
}

void VoicePadder::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

juce::String VoicePadder::buildFilterChain(double startDelay, double totalDuration, double volume)
{
    // adelay takes whole milliseconds; all=1 applies the delay to every channel
    const int delayMs = juce::roundToInt(startDelay * 1000.0);

    juce::String chain;
    chain << "volume=" << juce::String(volume, 6)
          << ",adelay=" << delayMs << ":all=1"
          << ",apad=whole_dur=" << FFmpegExecutor::formatSeconds(totalDuration);
    return chain;
}

PipelineResult VoicePadder::pad(const MediaTypes::MediaAsset& voice,
                                double startDelay,
                                double totalDuration,
                                double volume,
                                const juce::File& outputFile)
{
    if (!(totalDuration > 0.0) || !std::isfinite(totalDuration))
        return PipelineResult::fail(PipelineResult::ErrorKind::InvalidArgument,
                                    "Invalid total duration for voice " + voice.file.getFileName()
                                    + ": " + juce::String(totalDuration));

    if (!(startDelay >= 0.0) || !std::isfinite(startDelay))
        return PipelineResult::fail(PipelineResult::ErrorKind::InvalidArgument,
                                    "Invalid voice delay: " + juce::String(startDelay));

    if (!(volume >= 0.0 && volume <= 1.0))
        return PipelineResult::fail(PipelineResult::ErrorKind::InvalidArgument,
                                    "Voice volume must be within 0..1: " + juce::String(volume));

    if (!voice.file.existsAsFile())
        return PipelineResult::fail(PipelineResult::ErrorKind::Padding,
                                    "Voice file does not exist: " + voice.file.getFullPathName());

    if (logCallback)
        logCallback("Padding voice " + voice.file.getFileName() + ": starts at "
                    + juce::String(startDelay, 2) + "s, " + juce::String(totalDuration, 1) + "s total");

    juce::TemporaryFile temp(outputFile);

    juce::StringArray args = executor.createFFmpegCommand();
    args.add("-i");
    args.add(FFmpegExecutor::toCommandPath(voice.file));
    args.add("-vn");
    args.add("-af");
    args.add(buildFilterChain(startDelay, totalDuration, volume));
    args.add("-t");
    args.add(FFmpegExecutor::formatSeconds(totalDuration));
    args.add(FFmpegExecutor::toCommandPath(temp.getFile()));

    OutputCommit::Expectations expectations;
    expectations.duration = totalDuration;

    juce::String failureReason;
    if (!OutputCommit::runAndCommit(executor, prober, config, args, temp, expectations, failureReason))
        return PipelineResult::fail(PipelineResult::ErrorKind::Padding,
                                    "Failed to pad voice " + voice.file.getFileName(),
                                    failureReason);

    if (logCallback)
        logCallback("  Padded voice created (" + juce::String(totalDuration, 1) + "s total)");

    return PipelineResult::ok(outputFile);
}
