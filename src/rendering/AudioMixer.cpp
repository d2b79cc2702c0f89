#include "AudioMixer.h"
#include <cmath>
#include "OutputCommit.h"

AudioMixer::AudioMixer(FFmpegExecutor& executor, DurationProber& prober, const PipelineConfig& config)
    : executor(executor),
      prober(prober),
      config(config)
{
}

void AudioMixer::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

juce::String AudioMixer::buildFilterGraph()
{
    return "[0:a][1:a]amix=inputs=2:duration=first:dropout_transition=0:normalize=0[mix]";
}

PipelineResult AudioMixer::mix(const MediaTypes::MediaAsset& music,
                               const MediaTypes::MediaAsset& voice,
                               double targetDuration,
                               const juce::File& outputFile)
{
    if (!(targetDuration > 0.0) || !std::isfinite(targetDuration))
        return PipelineResult::fail(PipelineResult::ErrorKind::InvalidArgument,
                                    "Invalid mix duration: " + juce::String(targetDuration));

    for (const auto* input : { &music, &voice })
    {
        if (!input->file.existsAsFile())
            return PipelineResult::fail(PipelineResult::ErrorKind::Mix,
                                        "Mix input does not exist: " + input->file.getFullPathName());
    }

    if (logCallback)
        logCallback("Mixing " + voice.file.getFileName() + " over " + music.file.getFileName());

    juce::TemporaryFile temp(outputFile);

    // Music first: duration=first makes the music track set the length
    juce::StringArray args = executor.createFFmpegCommand();
    args.add("-i");
    args.add(FFmpegExecutor::toCommandPath(music.file));
    args.add("-i");
    args.add(FFmpegExecutor::toCommandPath(voice.file));
    args.add("-filter_complex");
    args.add(buildFilterGraph());
    args.add("-map");
    args.add("[mix]");
    args.add("-t");
    args.add(FFmpegExecutor::formatSeconds(targetDuration));
    args.add(FFmpegExecutor::toCommandPath(temp.getFile()));

    OutputCommit::Expectations expectations;
    expectations.duration = targetDuration;

    juce::String failureReason;
    if (!OutputCommit::runAndCommit(executor, prober, config, args, temp, expectations, failureReason))
        return PipelineResult::fail(PipelineResult::ErrorKind::Mix,
                                    "Failed to mix " + voice.file.getFileName() + " with " + music.file.getFileName(),
                                    failureReason);

    if (logCallback)
        logCallback("  Mixed audio saved: " + outputFile.getFileName());

    return PipelineResult::ok(outputFile);
}
