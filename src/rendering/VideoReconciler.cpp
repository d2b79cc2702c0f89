#include "VideoReconciler.h"
#include <cmath>

using MediaTypes::MediaAsset;
using MediaTypes::ReconciliationDecision;

VideoReconciler::VideoReconciler(FFmpegExecutor& executor, DurationProber& prober, const PipelineConfig& config)
    : executor(executor),
      prober(prober),
      config(config)
{
    loopStrategies.push_back(std::make_unique<StreamLoopStrategy>());
    loopStrategies.push_back(std::make_unique<SplitConcatStrategy>());
}

VideoReconciler::~VideoReconciler()
{
}

void VideoReconciler::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void VideoReconciler::setLoopStrategies(std::vector<std::unique_ptr<LoopStrategy>> strategies)
{
    loopStrategies = std::move(strategies);
}

void VideoReconciler::log(const juce::String& message)
{
    if (logCallback)
        logCallback(message);
}

//==============================================================================
PipelineResult VideoReconciler::reconcile(const MediaAsset& video,
                                          double targetDuration,
                                          const juce::File& outputFile)
{
    if (!(targetDuration > 0.0) || !std::isfinite(targetDuration))
        return PipelineResult::fail(PipelineResult::ErrorKind::InvalidArgument,
                                    "Invalid target duration for " + video.file.getFileName()
                                    + ": " + juce::String(targetDuration));

    if (outputFile == video.file)
        return PipelineResult::fail(PipelineResult::ErrorKind::InvalidArgument,
                                    "Output would overwrite the source video: " + outputFile.getFullPathName());

    double videoDuration = 0.0;
    const juce::Result probe = prober.probeDuration(video.file, videoDuration);

    if (probe.failed())
        return PipelineResult::fail(PipelineResult::ErrorKind::Probe, probe.getErrorMessage());

    const auto decision = ReconciliationDecision::decide(videoDuration, targetDuration, config.closenessTolerance);

    switch (decision.kind)
    {
        case ReconciliationDecision::Kind::AsIs:
            log("Video " + video.file.getFileName() + " (" + juce::String(videoDuration, 1)
                + "s) is close enough to " + juce::String(targetDuration, 1) + "s");
            return passThrough(video, outputFile);

        case ReconciliationDecision::Kind::Loop:
            log("Video " + video.file.getFileName() + " (" + juce::String(videoDuration, 1)
                + "s) is shorter than target (" + juce::String(targetDuration, 1) + "s), "
                + juce::String(decision.extras + 1) + " plays");
            return loop(video, targetDuration, decision.extras, outputFile);

        case ReconciliationDecision::Kind::Trim:
            log("Video " + video.file.getFileName() + " (" + juce::String(videoDuration, 1)
                + "s) is longer than target (" + juce::String(targetDuration, 1) + "s), trimming");
            return trim(video, targetDuration, outputFile);
    }

    jassertfalse;
    return PipelineResult::fail(PipelineResult::ErrorKind::Reconciliation, "Unhandled reconciliation decision");
}

//==============================================================================
PipelineResult VideoReconciler::passThrough(const MediaAsset& video, const juce::File& outputFile)
{
    if (!config.stripAudioInPassThrough)
        return PipelineResult::ok(video.file);

    int numAudioStreams = 0;
    const juce::Result streams = prober.countAudioStreams(video.file, numAudioStreams);

    if (streams.failed())
        return PipelineResult::fail(PipelineResult::ErrorKind::Probe, streams.getErrorMessage());

    if (numAudioStreams == 0)
        return PipelineResult::ok(video.file);

    // Drop the audio without touching the video stream
    log("  Removing " + juce::String(numAudioStreams) + " audio stream(s) with a stream copy");

    juce::TemporaryFile temp(outputFile);

    juce::StringArray args = executor.createFFmpegCommand();
    args.add("-i");
    args.add(FFmpegExecutor::toCommandPath(video.file));
    args.add("-map");
    args.add("0:v");
    args.add("-c:v");
    args.add("copy");
    args.add("-an");
    args.add("-movflags");
    args.add("+faststart");
    args.add(FFmpegExecutor::toCommandPath(temp.getFile()));

    juce::String failureReason;
    if (!commit(args, temp, -1.0, failureReason))
        return PipelineResult::fail(PipelineResult::ErrorKind::Reconciliation,
                                    "Failed to strip audio from " + video.file.getFileName(),
                                    failureReason);

    return PipelineResult::ok(outputFile);
}

//==============================================================================
PipelineResult VideoReconciler::loop(const MediaAsset& video,
                                     double targetDuration,
                                     int extras,
                                     const juce::File& outputFile)
{
    juce::StringArray failures;

    for (const auto& strategy : loopStrategies)
    {
        juce::TemporaryFile temp(outputFile);

        const juce::StringArray args = strategy->buildCommand(executor, video.file, targetDuration, extras,
                                                              config.videoProfile, temp.getFile());

        juce::String failureReason;
        if (commit(args, temp, targetDuration, failureReason))
        {
            log("  Looped video saved with " + strategy->getName() + " (audio removed for clean mixing)");
            return PipelineResult::ok(outputFile);
        }

        log("  " + strategy->getName() + " failed, trying next strategy");
        failures.add("[" + strategy->getName() + "] " + failureReason);
    }

    if (failures.isEmpty())
        failures.add("No loop strategy configured");

    return PipelineResult::fail(PipelineResult::ErrorKind::Reconciliation,
                                "Every loop strategy failed for " + video.file.getFileName(),
                                failures.joinIntoString("\n"));
}

//==============================================================================
PipelineResult VideoReconciler::trim(const MediaAsset& video, double targetDuration, const juce::File& outputFile)
{
    // Re-encode rather than stream copy, a copy can only cut on a keyframe
    juce::TemporaryFile temp(outputFile);

    juce::StringArray args = executor.createFFmpegCommand();
    args.add("-i");
    args.add(FFmpegExecutor::toCommandPath(video.file));
    args.add("-t");
    args.add(FFmpegExecutor::formatSeconds(targetDuration));
    args.add("-an");
    args.addArray(config.videoProfile.toArguments());
    args.add(FFmpegExecutor::toCommandPath(temp.getFile()));

    juce::String failureReason;
    if (!commit(args, temp, targetDuration, failureReason))
        return PipelineResult::fail(PipelineResult::ErrorKind::Reconciliation,
                                    "Failed to trim " + video.file.getFileName(),
                                    failureReason);

    log("  Trimmed video saved (audio removed for clean mixing)");
    return PipelineResult::ok(outputFile);
}

//==============================================================================
bool VideoReconciler::commit(const juce::StringArray& command,
                             juce::TemporaryFile& temp,
                             double expectedDuration,
                             juce::String& failureReason)
{
    OutputCommit::Expectations expectations;
    expectations.duration = expectedDuration;
    expectations.requireNoAudio = true;

    return OutputCommit::runAndCommit(executor, prober, config, command, temp, expectations, failureReason);
}
