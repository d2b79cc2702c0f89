/*
  ==============================================================================
    Main.cpp - Command line entry point
  ==============================================================================
*/

#include <juce_core/juce_core.h>
#include <iostream>
#include "../config/PipelineConfig.h"
#include "../rendering/PipelineOrchestrator.h"
#include "ProcessRegistry.h"
#include "SessionLogger.h"

using MediaTypes::MediaAsset;

namespace
{
    const char* const applicationName = "quoteclip";
    const char* const applicationVersion = "1.0.0";

    /**
     * Everything one command needs: the loaded configuration, an executor and,
     * when a log directory is configured, a session log directory holding
     * session.log plus the per-command FFmpeg logs.
     *
     * Consumes the global --config and --log-dir options from the argument list.
     */
    class CommandSession
    {
    public:
        explicit CommandSession(juce::ArgumentList& args)
        {
            if (args.containsOption("--config"))
            {
                const juce::File configFile = args.getExistingFileForOptionAndRemove("--config");
                const juce::Result loaded = PipelineConfig::loadFromFile(configFile, config);

                if (loaded.failed())
                    juce::ConsoleApplication::fail(loaded.getErrorMessage());
            }

            if (args.containsOption("--log-dir"))
                config.logDirectory = args.getFileForOptionAndRemove("--log-dir");

            startLogging();

            executor = std::make_unique<FFmpegExecutor>(config.ffmpegPath, config.ffprobePath);
            executor->setLogCallback([](const juce::String& message) { juce::Logger::writeToLog("[FFMPEG] " + message); });

            if (sessionDirectory != juce::File())
                executor->setSessionLogDirectory(sessionDirectory.getChildFile("ffmpeg"));

            orchestrator = std::make_unique<PipelineOrchestrator>(*executor, config);
        }

        ~CommandSession()
        {
            const int killed = ProcessRegistry::getInstance().terminateAll();
            if (killed > 0)
                juce::Logger::writeToLog("Terminated " + juce::String(killed) + " unfinished process(es)");

            juce::Logger::writeToLog("----------------------------------------------------");
            juce::Logger::writeToLog("Finished: " + juce::Time::getCurrentTime().toString(true, true));

            orchestrator.reset();

            if (executor != nullptr)
                executor->setSessionLogDirectory(juce::File());

            if (sessionLogger != nullptr)
            {
                juce::Logger::setCurrentLogger(previousLogger);
                sessionLogger.reset();
            }
        }

        const PipelineConfig& getConfig() const noexcept    { return config; }
        FFmpegExecutor& getExecutor() noexcept              { return *executor; }
        PipelineOrchestrator& getOrchestrator() noexcept    { return *orchestrator; }

    private:
        void startLogging()
        {
            if (config.logDirectory == juce::File())
                return;

            if (!config.logDirectory.isDirectory() && config.logDirectory.createDirectory().failed())
                juce::ConsoleApplication::fail("Could not create log directory " + config.logDirectory.getFullPathName());

            sessionDirectory = SessionLogger::createTimestampedDirectory(config.logDirectory, "session");
            if (sessionDirectory == juce::File())
                juce::ConsoleApplication::fail("Could not create a session directory in " + config.logDirectory.getFullPathName());

            previousLogger = juce::Logger::getCurrentLogger();
            sessionLogger = std::make_unique<SessionLogger>(sessionDirectory.getChildFile("session.log"), previousLogger);
            juce::Logger::setCurrentLogger(sessionLogger.get());

            juce::Logger::writeToLog("----------------------------------------------------");
            juce::Logger::writeToLog(juce::String(applicationName) + " " + applicationVersion
                                     + " started: " + juce::Time::getCurrentTime().toString(true, true));
            juce::Logger::writeToLog("----------------------------------------------------");
        }

        PipelineConfig config;
        juce::File sessionDirectory;
        juce::Logger* previousLogger = nullptr;
        std::unique_ptr<SessionLogger> sessionLogger;
        std::unique_ptr<FFmpegExecutor> executor;
        std::unique_ptr<PipelineOrchestrator> orchestrator;
    };

    //==============================================================================
    double parseNumber(const juce::String& option, const juce::String& text)
    {
        if (!text.containsOnly("0123456789.") || !text.containsAnyOf("0123456789"))
            juce::ConsoleApplication::fail("Expected a non-negative number for " + option + ", got \"" + text + "\"");

        return text.getDoubleValue();
    }

    double takeNumberOption(juce::ArgumentList& args, const juce::String& option, double fallback)
    {
        if (!args.containsOption(option))
            return fallback;

        return parseNumber(option, args.removeValueForOption(option));
    }

    double takeRequiredNumberOption(juce::ArgumentList& args, const juce::String& option)
    {
        args.failIfOptionIsMissing(option);
        return parseNumber(option, args.removeValueForOption(option));
    }

    int exitCodeFor(const PipelineResult& result)
    {
        switch (result.getErrorKind())
        {
            case PipelineResult::ErrorKind::None:            return 0;
            case PipelineResult::ErrorKind::InvalidArgument: return 2;
            case PipelineResult::ErrorKind::Cancelled:       return 130;
            default:                                          return 1;
        }
    }

    void report(const PipelineResult& result)
    {
        if (result.failed())
            juce::ConsoleApplication::fail(result.describe(), exitCodeFor(result));

        std::cout << result.getOutputFile().getFullPathName() << std::endl;
    }

    //==============================================================================
    void runProbe(const juce::ArgumentList& arguments)
    {
        juce::ArgumentList args(arguments);
        CommandSession session(args);
        args.checkMinNumArguments(2);

        DurationProber& prober = session.getOrchestrator().getDurationProber();
        bool anyFailed = false;

        for (int i = 1; i < args.size(); ++i)
        {
            const juce::File file = args[i].resolveAsFile();

            double duration = 0.0;
            int numAudioStreams = 0;

            juce::Result result = prober.probeDuration(file, duration);
            if (result.wasOk())
                result = prober.countAudioStreams(file, numAudioStreams);

            if (result.failed())
            {
                std::cerr << file.getFileName() << ": " << result.getErrorMessage() << std::endl;
                anyFailed = true;
                continue;
            }

            std::cout << file.getFileName() << ": " << FFmpegExecutor::formatSeconds(duration) << "s, "
                      << numAudioStreams << " audio stream(s)" << std::endl;
        }

        if (anyFailed)
            juce::ConsoleApplication::fail("One or more files could not be probed");
    }

    void runCheck(const juce::ArgumentList& arguments)
    {
        juce::ArgumentList args(arguments);
        CommandSession session(args);

        FFmpegExecutor& executor = session.getExecutor();
        std::cout << "ffmpeg:  " << executor.getFFmpegPath() << std::endl;
        std::cout << "ffprobe: " << executor.getFFprobePath() << std::endl;

        if (!executor.checkFFmpegAvailability())
            juce::ConsoleApplication::fail("FFmpeg or FFprobe could not be started");

        std::cout << "OK" << std::endl;
    }

    void runPrepareVideo(const juce::ArgumentList& arguments)
    {
        juce::ArgumentList args(arguments);
        CommandSession session(args);

        const bool hasDuration = args.containsOption("--duration");
        double duration = takeNumberOption(args, "--duration", 0.0);

        args.checkMinNumArguments(hasDuration ? 3 : 4);

        const juce::File video = args[1].resolveAsExistingFile();
        const juce::File output = args[hasDuration ? 2 : 3].resolveAsFile();

        if (!hasDuration)
        {
            const juce::File audio = args[2].resolveAsExistingFile();
            const juce::Result probed = session.getOrchestrator().getDurationProber().probeDuration(audio, duration);

            if (probed.failed())
                juce::ConsoleApplication::fail(probed.getErrorMessage());
        }

        report(session.getOrchestrator().prepareVideoForAudio(MediaAsset::video(video), duration, output));
    }

    void runPadVoice(const juce::ArgumentList& arguments)
    {
        juce::ArgumentList args(arguments);
        CommandSession session(args);
        const PipelineConfig& config = session.getConfig();

        const double duration = takeRequiredNumberOption(args, "--duration");
        const double delay = takeNumberOption(args, "--delay", config.defaultVoiceDelay);
        const double volume = takeNumberOption(args, "--volume", config.defaultVoiceVolume);

        args.checkMinNumArguments(3);

        report(session.getOrchestrator().getVoicePadder().pad(MediaAsset::audio(args[1].resolveAsExistingFile()),
                                                              delay, duration, volume,
                                                              args[2].resolveAsFile()));
    }

    void runPrepareBackground(const juce::ArgumentList& arguments)
    {
        juce::ArgumentList args(arguments);
        CommandSession session(args);
        const PipelineConfig& config = session.getConfig();

        const double duration = takeRequiredNumberOption(args, "--duration");
        const double volume = takeNumberOption(args, "--volume", config.defaultMusicVolume);
        const double fade = takeNumberOption(args, "--fade", config.fadeDuration);

        args.checkMinNumArguments(3);

        report(session.getOrchestrator().getBackgroundTrackLooper()
                   .prepareBackground(MediaAsset::audio(args[1].resolveAsExistingFile()),
                                      duration, volume, args[2].resolveAsFile(), fade));
    }

    void runMix(const juce::ArgumentList& arguments)
    {
        juce::ArgumentList args(arguments);
        CommandSession session(args);

        const double duration = takeRequiredNumberOption(args, "--duration");
        args.checkMinNumArguments(4);

        report(session.getOrchestrator().getAudioMixer().mix(MediaAsset::audio(args[1].resolveAsExistingFile()),
                                                             MediaAsset::audio(args[2].resolveAsExistingFile()),
                                                             duration, args[3].resolveAsFile()));
    }

    void runMixVoiceMusic(const juce::ArgumentList& arguments)
    {
        juce::ArgumentList args(arguments);
        CommandSession session(args);
        const PipelineConfig& config = session.getConfig();

        MediaTypes::TargetSpec spec;
        spec.targetDuration = takeRequiredNumberOption(args, "--duration");
        spec.voiceDelay = takeNumberOption(args, "--delay", config.defaultVoiceDelay);
        spec.voiceVolume = takeNumberOption(args, "--voice-volume", config.defaultVoiceVolume);
        spec.musicVolume = takeNumberOption(args, "--music-volume", config.defaultMusicVolume);
        spec.fadeDuration = takeNumberOption(args, "--fade", config.fadeDuration);

        MediaAsset voice;
        if (args.containsOption("--voice"))
            voice = MediaAsset::audio(args.getExistingFileForOptionAndRemove("--voice"));

        args.checkMinNumArguments(3);

        report(session.getOrchestrator().mixVoiceAndMusic(voice,
                                                          MediaAsset::audio(args[1].resolveAsExistingFile()),
                                                          spec, args[2].resolveAsFile()));
    }
}

//==============================================================================
int main(int argc, char* argv[])
{
    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h",
                       "Usage: quoteclip <command> [arguments] [--config=<file>] [--log-dir=<dir>]",
                       true);
    app.addVersionCommand("--version|-v", juce::String(applicationName) + " " + applicationVersion);

    app.addCommand({ "probe",
                     "probe <file>...",
                     "Prints the duration and audio stream count of each file", {},
                     runProbe });

    app.addCommand({ "check",
                     "check",
                     "Checks that ffmpeg and ffprobe can be started", {},
                     runCheck });

    app.addCommand({ "prepare-video",
                     "prepare-video <video> <audio> <output> | prepare-video <video> <output> --duration=<s>",
                     "Loops or trims a video to the length of an audio file and removes its audio", {},
                     runPrepareVideo });

    app.addCommand({ "pad-voice",
                     "pad-voice <voice> <output> --duration=<s> [--delay=<s>] [--volume=<0..1>]",
                     "Delays a voice track and pads it with silence to an exact length", {},
                     runPadVoice });

    app.addCommand({ "prepare-background",
                     "prepare-background <music> <output> --duration=<s> [--volume=<0..1>] [--fade=<s>]",
                     "Loops background music to a length, sets its level and fades it out", {},
                     runPrepareBackground });

    app.addCommand({ "mix",
                     "mix <music> <voice> <output> --duration=<s>",
                     "Sums two prepared tracks without changing their levels", {},
                     runMix });

    app.addCommand({ "mix-voice-music",
                     "mix-voice-music <music> <output> --duration=<s> [--voice=<file>] [--delay=<s>]"
                     " [--voice-volume=<0..1>] [--music-volume=<0..1>] [--fade=<s>]",
                     "Builds a finished voice and music soundtrack", {},
                     runMixVoiceMusic });

    return app.findAndRunCommand(juce::ArgumentList(argc, argv), true);
}
