#include "OutputCommit.h"

namespace OutputCommit
{
    namespace
    {
        bool verify(DurationProber& prober,
                    const PipelineConfig& config,
                    const juce::File& produced,
                    const Expectations& expectations,
                    juce::String& failureReason)
        {
            if (expectations.duration > 0.0)
            {
                const juce::Result check = prober.verifyDuration(produced, expectations.duration, config.durationTolerance);
                if (check.failed())
                {
                    failureReason = check.getErrorMessage();
                    return false;
                }
            }

            if (expectations.requireNoAudio)
            {
                int numAudioStreams = 0;
                const juce::Result streams = prober.countAudioStreams(produced, numAudioStreams);

                if (streams.failed())
                {
                    failureReason = streams.getErrorMessage();
                    return false;
                }

                if (numAudioStreams != 0)
                {
                    failureReason = produced.getFileName() + " still has "
                                    + juce::String(numAudioStreams) + " audio stream(s)";
                    return false;
                }
            }

            return true;
        }
    }

    bool runAndCommit(FFmpegExecutor& executor,
                      DurationProber& prober,
                      const PipelineConfig& config,
                      const juce::StringArray& command,
                      juce::TemporaryFile& temp,
                      const Expectations& expectations,
                      juce::String& failureReason)
    {
        const CommandOutcome outcome = executor.executeCommand(command);

        if (!outcome.succeeded())
        {
            failureReason = outcome.getDiagnosticTail();
            return false;
        }

        const juce::File& produced = temp.getFile();

        if (!produced.existsAsFile() || produced.getSize() <= 0)
        {
            failureReason = "FFmpeg reported success but wrote no output\n" + outcome.getDiagnosticTail();
            return false;
        }

        if (config.verifyOutputDurations && !verify(prober, config, produced, expectations, failureReason))
            return false;

        if (!temp.overwriteTargetFileWithTemporary())
        {
            failureReason = "Could not move " + produced.getFileName() + " over "
                            + temp.getTargetFile().getFullPathName();
            return false;
        }

        return true;
    }
}
