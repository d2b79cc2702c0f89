// Unit tests for VideoReconciler: loop, trim, as-is and the strategy fallback.

#include "fixtures/PipelineTestBase.h"
#include "rendering/VideoReconciler.h"
#include <limits>

using MediaTypes::MediaAsset;
using MediaTypes::ReconciliationDecision;

namespace
{
  // Loops without capping the length, so the result runs long
  class UncappedLoopStrategy : public LoopStrategy
  {
  public:
    juce::String getName() const override { return "uncapped"; }

    juce::StringArray buildCommand(const FFmpegExecutor& executor, const juce::File& source,
                                   double, int extras, const VideoProfile& profile,
                                   const juce::File& output) const override
    {
      juce::StringArray args = executor.createFFmpegCommand();
      args.add("-stream_loop");
      args.add(juce::String(extras));
      args.add("-i");
      args.add(FFmpegExecutor::toCommandPath(source));
      args.add("-an");
      args.addArray(profile.toArguments());
      args.add(FFmpegExecutor::toCommandPath(output));
      return args;
    }
  };
}

class VideoReconcilerTest : public PipelineTestBase
{
protected:
  VideoReconciler reconciler { executor, prober, config };
};

//==============================================================================
TEST(ReconciliationDecisionTest, ChoosesBranchFromProbedLength)
{
  auto shortClip = ReconciliationDecision::decide(10.0, 25.0, 1.0);
  EXPECT_EQ(shortClip.kind, ReconciliationDecision::Kind::Loop);
  EXPECT_EQ(shortClip.extras, 2);

  auto exactMultiple = ReconciliationDecision::decide(10.0, 30.0, 1.0);
  EXPECT_EQ(exactMultiple.kind, ReconciliationDecision::Kind::Loop);
  EXPECT_EQ(exactMultiple.extras, 2);

  EXPECT_EQ(ReconciliationDecision::decide(24.5, 25.0, 1.0).kind, ReconciliationDecision::Kind::AsIs);
  EXPECT_EQ(ReconciliationDecision::decide(25.9, 25.0, 1.0).kind, ReconciliationDecision::Kind::AsIs);
  EXPECT_EQ(ReconciliationDecision::decide(26.0, 25.0, 1.0).kind, ReconciliationDecision::Kind::Trim);
  EXPECT_EQ(ReconciliationDecision::decide(40.0, 25.0, 1.0).kind, ReconciliationDecision::Kind::Trim);
}

TEST(ReconciliationDecisionTest, HugeLoopCountIsClampedToInt)
{
  auto decision = ReconciliationDecision::decide(0.001, 1.0e12, 1.0);

  EXPECT_EQ(decision.kind, ReconciliationDecision::Kind::Loop);
  EXPECT_EQ(decision.extras, std::numeric_limits<int>::max() - 1);
}

TEST(SplitConcatStrategyTest, GraphHasOneBranchPerPlay)
{
  EXPECT_EQ(SplitConcatStrategy::buildFilterGraph(3),
            "[0:v]split=3[v0][v1][v2];[v0][v1][v2]concat=n=3:v=1:a=0[cat]");

  // Never fewer than two branches
  EXPECT_EQ(SplitConcatStrategy::buildFilterGraph(1),
            "[0:v]split=2[v0][v1];[v0][v1]concat=n=2:v=1:a=0[cat]");
}

//==============================================================================
TEST_F(VideoReconcilerTest, ShortVideoIsLoopedToTarget)
{
  const juce::File source = media("nature.mp4", 10.0);
  const juce::File output = workDir.getChildFile("nature_looped.mp4");

  const PipelineResult result = reconciler.reconcile(MediaAsset::video(source), 25.0, output);

  ASSERT_TRUE(result.wasOk()) << result.describe();
  EXPECT_EQ(result.getOutputFile(), output);

  const auto encodes = executor.getFFmpegCommands();
  ASSERT_EQ(encodes.size(), 1);
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(encodes[0], "-stream_loop"), "2");
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(encodes[0], "-t"), "25.000");
  EXPECT_TRUE(encodes[0].contains("-an"));

  EXPECT_NEAR(FakeFFmpegExecutor::readDuration(output), 25.0, 0.05);
  EXPECT_EQ(FakeFFmpegExecutor::readAudioStreams(output), 0);
  EXPECT_TRUE(source.existsAsFile());
}

TEST_F(VideoReconcilerTest, LongVideoIsTrimmedWithCanonicalProfile)
{
  const juce::File source = media("city.mp4", 40.0);
  const juce::File output = workDir.getChildFile("city_trimmed.mp4");

  const PipelineResult result = reconciler.reconcile(MediaAsset::video(source), 25.0, output);

  ASSERT_TRUE(result.wasOk()) << result.describe();

  const auto encodes = executor.getFFmpegCommands();
  ASSERT_EQ(encodes.size(), 1);
  const juce::StringArray& command = encodes[0];

  EXPECT_FALSE(command.contains("-stream_loop"));
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(command, "-t"), "25.000");
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(command, "-r"), "30");
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(command, "-pix_fmt"), "yuv420p");
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(command, "-c:v"), "libx264");
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(command, "-preset"), "veryfast");
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(command, "-crf"), "18");
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(command, "-movflags"), "+faststart");
  EXPECT_TRUE(command.contains("-an"));

  EXPECT_NEAR(FakeFFmpegExecutor::readDuration(output), 25.0, 0.05);
  EXPECT_EQ(FakeFFmpegExecutor::readAudioStreams(output), 0);
}

TEST_F(VideoReconcilerTest, FallsBackToSplitConcatWhenStreamLoopFails)
{
  const juce::File source = media("nature.mp4", 10.0);
  const juce::File output = workDir.getChildFile("nature_looped.mp4");
  executor.failCommandsContaining("-stream_loop");

  const PipelineResult result = reconciler.reconcile(MediaAsset::video(source), 25.0, output);

  ASSERT_TRUE(result.wasOk()) << result.describe();

  const auto encodes = executor.getFFmpegCommands();
  ASSERT_EQ(encodes.size(), 2);
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(encodes[1], "-filter_complex"),
            "[0:v]split=3[v0][v1][v2];[v0][v1][v2]concat=n=3:v=1:a=0[cat]");
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(encodes[1], "-map"), "[cat]");

  EXPECT_NEAR(FakeFFmpegExecutor::readDuration(output), 25.0, 0.05);
  EXPECT_EQ(FakeFFmpegExecutor::readAudioStreams(output), 0);

  // The partial file from the failed attempt is gone
  EXPECT_TRUE(filesOtherThan({ source, output }).isEmpty()) << filesOtherThan({ source, output }).joinIntoString(", ");
}

TEST_F(VideoReconcilerTest, FallbackCoversTargetsBeyondTwoPlays)
{
  const juce::File source = media("short.mp4", 4.0);
  const juce::File output = workDir.getChildFile("short_looped.mp4");
  executor.failCommandsContaining("-stream_loop");

  const PipelineResult result = reconciler.reconcile(MediaAsset::video(source), 25.0, output);

  ASSERT_TRUE(result.wasOk()) << result.describe();
  EXPECT_NEAR(FakeFFmpegExecutor::readDuration(output), 25.0, 0.05);
}

TEST_F(VideoReconcilerTest, AllStrategiesFailingReportsEveryDiagnostic)
{
  const juce::File source = media("nature.mp4", 10.0);
  const juce::File output = workDir.getChildFile("nature_looped.mp4");
  executor.failCommandsContaining("-stream_loop");
  executor.failCommandsContaining("split=");

  const PipelineResult result = reconciler.reconcile(MediaAsset::video(source), 25.0, output);

  ASSERT_TRUE(result.failed());
  EXPECT_EQ(result.getErrorKind(), PipelineResult::ErrorKind::Reconciliation);
  EXPECT_TRUE(result.getErrorMessage().contains("nature.mp4"));
  EXPECT_TRUE(result.getDiagnostics().contains("[stream-loop]"));
  EXPECT_TRUE(result.getDiagnostics().contains("[split-concat]"));
  EXPECT_TRUE(result.getDiagnostics().contains("Conversion failed"));

  EXPECT_FALSE(output.exists());
  EXPECT_TRUE(filesOtherThan({ source }).isEmpty());
}

TEST_F(VideoReconcilerTest, FailedEncodeLeavesExistingOutputUntouched)
{
  const juce::File source = media("city.mp4", 40.0);
  const juce::File output = media("city_trimmed.mp4", 99.0);
  executor.failCommandsContaining("libx264");

  const PipelineResult result = reconciler.reconcile(MediaAsset::video(source), 25.0, output);

  EXPECT_EQ(result.getErrorKind(), PipelineResult::ErrorKind::Reconciliation);
  EXPECT_NEAR(FakeFFmpegExecutor::readDuration(output), 99.0, 1e-6);
}

TEST_F(VideoReconcilerTest, CloseSilentVideoIsReturnedAsIs)
{
  const juce::File source = media("close.mp4", 24.5, 0);
  const juce::File output = workDir.getChildFile("close_out.mp4");

  const PipelineResult result = reconciler.reconcile(MediaAsset::video(source), 25.0, output);

  ASSERT_TRUE(result.wasOk()) << result.describe();
  EXPECT_EQ(result.getOutputFile(), source);
  EXPECT_EQ(executor.getFFmpegCommands().size(), 0);
  EXPECT_FALSE(output.exists());
}

TEST_F(VideoReconcilerTest, CloseVideoWithAudioHasItsAudioStripped)
{
  const juce::File source = media("close.mp4", 25.4, 2);
  const juce::File output = workDir.getChildFile("close_out.mp4");

  const PipelineResult result = reconciler.reconcile(MediaAsset::video(source), 25.0, output);

  ASSERT_TRUE(result.wasOk()) << result.describe();
  EXPECT_EQ(result.getOutputFile(), output);

  const auto encodes = executor.getFFmpegCommands();
  ASSERT_EQ(encodes.size(), 1);
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(encodes[0], "-c:v"), "copy");
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(encodes[0], "-map"), "0:v");
  EXPECT_FALSE(encodes[0].contains("-t"));

  // Stream copy keeps the source length
  EXPECT_NEAR(FakeFFmpegExecutor::readDuration(output), 25.4, 1e-6);
  EXPECT_EQ(FakeFFmpegExecutor::readAudioStreams(output), 0);
}

TEST_F(VideoReconcilerTest, AudioStrippingCanBeDisabled)
{
  config.stripAudioInPassThrough = false;
  const juce::File source = media("close.mp4", 25.4, 1);

  const PipelineResult result = reconciler.reconcile(MediaAsset::video(source), 25.0,
                                                     workDir.getChildFile("close_out.mp4"));

  ASSERT_TRUE(result.wasOk());
  EXPECT_EQ(result.getOutputFile(), source);
  EXPECT_EQ(executor.getCommands().size(), 1);
}

TEST_F(VideoReconcilerTest, ProbeFailureIsReportedWithoutEncoding)
{
  const juce::File source = workDir.getChildFile("broken.mp4");
  FakeFFmpegExecutor::writeMediaWithProbeOutput(source, "N/A");

  const PipelineResult result = reconciler.reconcile(MediaAsset::video(source), 25.0,
                                                     workDir.getChildFile("out.mp4"));

  EXPECT_EQ(result.getErrorKind(), PipelineResult::ErrorKind::Probe);
  EXPECT_TRUE(result.getErrorMessage().contains("broken.mp4"));
  EXPECT_EQ(executor.getFFmpegCommands().size(), 0);
}

TEST_F(VideoReconcilerTest, RejectsInvalidArguments)
{
  const juce::File source = media("nature.mp4", 10.0);

  EXPECT_EQ(reconciler.reconcile(MediaAsset::video(source), 0.0, workDir.getChildFile("a.mp4")).getErrorKind(),
            PipelineResult::ErrorKind::InvalidArgument);
  EXPECT_EQ(reconciler.reconcile(MediaAsset::video(source), -3.0, workDir.getChildFile("a.mp4")).getErrorKind(),
            PipelineResult::ErrorKind::InvalidArgument);
  EXPECT_EQ(reconciler.reconcile(MediaAsset::video(source), 25.0, source).getErrorKind(),
            PipelineResult::ErrorKind::InvalidArgument);

  EXPECT_EQ(executor.getCommands().size(), 0);
}

TEST_F(VideoReconcilerTest, VerificationRejectsWrongLengthAndMovesOn)
{
  config.verifyOutputDurations = true;

  std::vector<std::unique_ptr<LoopStrategy>> strategies;
  strategies.push_back(std::make_unique<UncappedLoopStrategy>());
  strategies.push_back(std::make_unique<StreamLoopStrategy>());
  reconciler.setLoopStrategies(std::move(strategies));

  const juce::File source = media("nature.mp4", 10.0);
  const juce::File output = workDir.getChildFile("nature_looped.mp4");

  const PipelineResult result = reconciler.reconcile(MediaAsset::video(source), 25.0, output);

  ASSERT_TRUE(result.wasOk()) << result.describe();
  EXPECT_EQ(executor.getFFmpegCommands().size(), 2);
  EXPECT_NEAR(FakeFFmpegExecutor::readDuration(output), 25.0, 0.05);
  EXPECT_TRUE(filesOtherThan({ source, output }).isEmpty());
}
