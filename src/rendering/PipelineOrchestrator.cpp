#include "PipelineOrchestrator.h"
#include <cmath>
#include "ScratchDirectory.h"

using MediaTypes::MediaAsset;
using MediaTypes::TargetSpec;

PipelineOrchestrator::PipelineOrchestrator(FFmpegExecutor& executor, const PipelineConfig& config)
    : config(config)
{
    // Create component instances
    prober = std::make_unique<DurationProber>(executor);
    videoReconciler = std::make_unique<VideoReconciler>(executor, *prober, config);
    voicePadder = std::make_unique<VoicePadder>(executor, *prober, config);
    backgroundLooper = std::make_unique<BackgroundTrackLooper>(executor, *prober, config);
    audioMixer = std::make_unique<AudioMixer>(executor, *prober, config);

    auto forward = [this](const juce::String& message) { log(message); };
    videoReconciler->setLogCallback(forward);
    voicePadder->setLogCallback(forward);
    backgroundLooper->setLogCallback(forward);
    audioMixer->setLogCallback(forward);
}

PipelineOrchestrator::~PipelineOrchestrator()
{
}

void PipelineOrchestrator::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void PipelineOrchestrator::log(const juce::String& message)
{
    juce::Logger::writeToLog("[PIPELINE] " + message);

    if (logCallback)
        logCallback(message);
}

juce::String PipelineOrchestrator::getStateName(PipelineState s)
{
    switch (s)
    {
        case PipelineState::Idle:           return "Idle";
        case PipelineState::PreparingVideo: return "Preparing video";
        case PipelineState::PaddingVoice:   return "Padding voice";
        case PipelineState::PreparingMusic: return "Preparing music";
        case PipelineState::Mixing:         return "Mixing";
        case PipelineState::Completed:      return "Completed";
        case PipelineState::Failed:         return "Failed";
        case PipelineState::Cancelled:      return "Cancelled";
    }

    return {};
}

void PipelineOrchestrator::updateState(PipelineState newState)
{
    state = newState;
    log("State: " + getStateName(newState));
}

bool PipelineOrchestrator::checkCancelled(PipelineResult& result)
{
    if (!shouldCancel.load())
        return false;

    result = PipelineResult::fail(PipelineResult::ErrorKind::Cancelled, "Operation cancelled");
    return true;
}

PipelineResult PipelineOrchestrator::finish(PipelineResult result)
{
    if (result.wasOk())
        updateState(PipelineState::Completed);
    else if (result.getErrorKind() == PipelineResult::ErrorKind::Cancelled)
        updateState(PipelineState::Cancelled);
    else
        updateState(PipelineState::Failed);

    if (result.failed())
        log("ERROR: " + result.describe());

    return result;
}

juce::Result PipelineOrchestrator::validate(const TargetSpec& spec) const
{
    if (!(spec.targetDuration > 0.0) || !std::isfinite(spec.targetDuration))
        return juce::Result::fail("Target duration must be positive: " + juce::String(spec.targetDuration));

    if (!(spec.voiceDelay >= 0.0))
        return juce::Result::fail("Voice delay must not be negative: " + juce::String(spec.voiceDelay));

    if (!(spec.voiceVolume >= 0.0 && spec.voiceVolume <= 1.0))
        return juce::Result::fail("Voice volume must be within 0..1: " + juce::String(spec.voiceVolume));

    if (!(spec.musicVolume >= 0.0 && spec.musicVolume <= 1.0))
        return juce::Result::fail("Music volume must be within 0..1: " + juce::String(spec.musicVolume));

    if (!(spec.fadeDuration >= 0.0))
        return juce::Result::fail("Fade duration must not be negative: " + juce::String(spec.fadeDuration));

    return juce::Result::ok();
}

//==============================================================================
PipelineResult PipelineOrchestrator::prepareVideoForAudio(const MediaAsset& video,
                                                          double audioDuration,
                                                          const juce::File& outputFile)
{
    shouldCancel = false;

    updateState(PipelineState::PreparingVideo);
    return finish(videoReconciler->reconcile(video, audioDuration, outputFile));
}

//==============================================================================
PipelineResult PipelineOrchestrator::mixVoiceAndMusic(const MediaAsset& voice,
                                                      const MediaAsset& music,
                                                      const TargetSpec& spec,
                                                      const juce::File& outputFile)
{
    shouldCancel = false;

    const juce::Result valid = validate(spec);
    if (valid.failed())
        return finish(PipelineResult::fail(PipelineResult::ErrorKind::InvalidArgument, valid.getErrorMessage()));

    if (music.isEmpty())
        return finish(PipelineResult::fail(PipelineResult::ErrorKind::InvalidArgument, "No music track supplied"));

    if (outputFile == music.file || (!voice.isEmpty() && outputFile == voice.file))
        return finish(PipelineResult::fail(PipelineResult::ErrorKind::InvalidArgument,
                                           "Output would overwrite an input: " + outputFile.getFullPathName()));

    log("Building " + juce::String(spec.targetDuration, 1) + "s soundtrack: " + outputFile.getFileName());

    PipelineResult result = PipelineResult::ok(outputFile);

    if (checkCancelled(result))
        return finish(result);

    // Acquired here, removed whichever way this function returns
    ScratchDirectory scratch(outputFile, config.scratchDirectoryName,
                             [this](const juce::String& message) { log(message); });

    if (!scratch.isValid())
        return finish(PipelineResult::fail(PipelineResult::ErrorKind::Workspace,
                                           "Could not create a working directory for " + outputFile.getFileName(),
                                           scratch.getCreationResult().getErrorMessage()));

    if (voice.isEmpty())
    {
        log("No voice supplied, music only");
        updateState(PipelineState::PreparingMusic);
        return finish(backgroundLooper->prepareBackground(music, spec.targetDuration, spec.musicVolume,
                                                          outputFile, spec.fadeDuration));
    }

    const juce::String extension = outputFile.getFileExtension();
    const juce::File paddedVoice = scratch.getFile("voice_padded" + extension);
    const juce::File preparedMusic = scratch.getFile("music_ready" + extension);

    // 1) Voice: delay, gain and pad to the full length
    updateState(PipelineState::PaddingVoice);
    result = voicePadder->pad(voice, spec.voiceDelay, spec.targetDuration, spec.voiceVolume, paddedVoice);
    if (result.failed())
        return finish(result);

    if (checkCancelled(result))
        return finish(result);

    // 2) Music: loop, gain and fade
    updateState(PipelineState::PreparingMusic);
    result = backgroundLooper->prepareBackground(music, spec.targetDuration, spec.musicVolume,
                                                 preparedMusic, spec.fadeDuration);
    if (result.failed())
        return finish(result);

    if (checkCancelled(result))
        return finish(result);

    // 3) Sum the two, no gain here
    updateState(PipelineState::Mixing);
    return finish(audioMixer->mix(MediaAsset::audio(preparedMusic), MediaAsset::audio(paddedVoice),
                                  spec.targetDuration, outputFile));
}
