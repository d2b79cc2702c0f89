#include "BackgroundTrackLooper.h"
#include <cmath>
#include <limits>
#include "OutputCommit.h"
#include "ScratchDirectory.h"

BackgroundTrackLooper::BackgroundTrackLooper(FFmpegExecutor& executor, DurationProber& prober, const PipelineConfig& config)
    : executor(executor),
      prober(prober),
      config(config)
{
}

void BackgroundTrackLooper::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void BackgroundTrackLooper::log(const juce::String& message)
{
    if (logCallback)
        logCallback(message);
}

//==============================================================================
int BackgroundTrackLooper::getNumRepeats(double musicDuration, double targetDuration)
{
    jassert(musicDuration > 0.0);

    if (musicDuration >= targetDuration)
        return 1;

    return (int) juce::jlimit(1.0, (double) std::numeric_limits<int>::max(),
                              std::ceil(targetDuration / musicDuration));
}

juce::String BackgroundTrackLooper::buildPlaylist(const juce::File& music, int repeats)
{
    const juce::String line = "file '" + FFmpegExecutor::toCommandPath(music) + "'";

    juce::StringArray lines;
    for (int i = 0; i < repeats; ++i)
        lines.add(line);

    return lines.joinIntoString("\n") + "\n";
}

juce::String BackgroundTrackLooper::buildFadeFilter(double musicVolume, double targetDuration, double fadeDuration)
{
    const double fadeStart = juce::jmax(0.0, targetDuration - fadeDuration);
    const double fadeLength = juce::jmin(fadeDuration, targetDuration);

    juce::String filter;
    filter << "volume=" << juce::String(musicVolume, 6)
           << ",afade=t=out:st=" << FFmpegExecutor::formatSeconds(fadeStart)
           << ":d=" << FFmpegExecutor::formatSeconds(fadeLength);
    return filter;
}

//==============================================================================
PipelineResult BackgroundTrackLooper::prepareBackground(const MediaTypes::MediaAsset& music,
                                                        double targetDuration,
                                                        double musicVolume,
                                                        const juce::File& outputFile,
                                                        double fadeDuration)
{
    if (!(targetDuration > 0.0) || !std::isfinite(targetDuration))
        return PipelineResult::fail(PipelineResult::ErrorKind::InvalidArgument,
                                    "Invalid target duration for music " + music.file.getFileName()
                                    + ": " + juce::String(targetDuration));

    if (!(musicVolume >= 0.0 && musicVolume <= 1.0))
        return PipelineResult::fail(PipelineResult::ErrorKind::InvalidArgument,
                                    "Music volume must be within 0..1: " + juce::String(musicVolume));

    if (fadeDuration < 0.0)
        fadeDuration = config.fadeDuration;

    double musicDuration = 0.0;
    const juce::Result probe = prober.probeDuration(music.file, musicDuration);

    if (probe.failed())
        return PipelineResult::fail(PipelineResult::ErrorKind::Probe,
                                    "Could not read duration of music " + music.file.getFileName(),
                                    probe.getErrorMessage());

    // Holds the playlist and the looped copy until this call returns
    std::unique_ptr<ScratchDirectory> scratch;

    juce::File fadeInput = music.file;

    if (musicDuration < targetDuration)
    {
        const int repeats = getNumRepeats(musicDuration, targetDuration);

        log("Music " + music.file.getFileName() + " (" + juce::String(musicDuration, 1)
            + "s) is shorter than " + juce::String(targetDuration, 1) + "s, repeating "
            + juce::String(repeats) + " times");

        scratch = std::make_unique<ScratchDirectory>(outputFile, config.scratchDirectoryName, logCallback);

        if (!scratch->isValid())
            return PipelineResult::fail(PipelineResult::ErrorKind::Workspace,
                                        "Could not create a working directory for " + music.file.getFileName(),
                                        scratch->getCreationResult().getErrorMessage());

        const juce::File playlistFile = scratch->getFile("music_playlist.txt");
        const juce::File loopedFile = scratch->getFile("music_looped" + music.file.getFileExtension());

        const juce::Result looped = loopToLength(music.file, repeats, targetDuration, playlistFile, loopedFile);

        if (looped.failed())
            return PipelineResult::fail(PipelineResult::ErrorKind::BackgroundPrep,
                                        "Failed to loop music " + music.file.getFileName(),
                                        looped.getErrorMessage());

        fadeInput = loopedFile;
    }
    else
    {
        log("Music " + music.file.getFileName() + " (" + juce::String(musicDuration, 1)
            + "s) covers " + juce::String(targetDuration, 1) + "s, no looping needed");
    }

    juce::TemporaryFile temp(outputFile);

    juce::StringArray args = executor.createFFmpegCommand();
    args.add("-i");
    args.add(FFmpegExecutor::toCommandPath(fadeInput));
    args.add("-vn");
    args.add("-af");
    args.add(buildFadeFilter(musicVolume, targetDuration, fadeDuration));
    args.add("-t");
    args.add(FFmpegExecutor::formatSeconds(targetDuration));
    args.add(FFmpegExecutor::toCommandPath(temp.getFile()));

    OutputCommit::Expectations expectations;
    expectations.duration = targetDuration;

    juce::String failureReason;
    if (!OutputCommit::runAndCommit(executor, prober, config, args, temp, expectations, failureReason))
        return PipelineResult::fail(PipelineResult::ErrorKind::BackgroundPrep,
                                    "Failed to apply volume and fade to music " + music.file.getFileName(),
                                    failureReason);

    log("  Background music ready (" + juce::String(targetDuration, 1) + "s, volume "
        + juce::String(musicVolume, 2) + ")");

    return PipelineResult::ok(outputFile);
}

//==============================================================================
juce::Result BackgroundTrackLooper::loopToLength(const juce::File& music,
                                                 int repeats,
                                                 double targetDuration,
                                                 const juce::File& playlistFile,
                                                 const juce::File& loopedFile)
{
    if (!playlistFile.replaceWithText(buildPlaylist(music, repeats)))
        return juce::Result::fail("Could not write playlist " + playlistFile.getFullPathName());

    juce::StringArray args = executor.createFFmpegCommand();
    args.add("-f");
    args.add("concat");
    args.add("-safe");
    args.add("0");
    args.add("-i");
    args.add(FFmpegExecutor::toCommandPath(playlistFile));
    args.add("-t");
    args.add(FFmpegExecutor::formatSeconds(targetDuration));
    args.add("-c");
    args.add("copy");
    args.add(FFmpegExecutor::toCommandPath(loopedFile));

    const CommandOutcome outcome = executor.executeCommand(args);

    if (!outcome.succeeded())
        return juce::Result::fail(outcome.getDiagnosticTail());

    if (!loopedFile.existsAsFile() || loopedFile.getSize() <= 0)
        return juce::Result::fail("FFmpeg reported success but wrote no looped track\n" + outcome.getDiagnosticTail());

    return juce::Result::ok();
}
