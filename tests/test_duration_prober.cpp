// Unit tests for DurationProber against the fake executor.

#include "fixtures/PipelineTestBase.h"

class DurationProberTest : public PipelineTestBase
{
};

TEST(DurationProberParseTest, AcceptsPlainSeconds)
{
  double seconds = 0.0;
  EXPECT_TRUE(DurationProber::parseDuration("12.500000\n", seconds));
  EXPECT_DOUBLE_EQ(seconds, 12.5);

  EXPECT_TRUE(DurationProber::parseDuration("  3 ", seconds));
  EXPECT_DOUBLE_EQ(seconds, 3.0);
}

TEST(DurationProberParseTest, RejectsMissingOrNonPositiveValues)
{
  double seconds = 42.0;
  EXPECT_FALSE(DurationProber::parseDuration("", seconds));
  EXPECT_FALSE(DurationProber::parseDuration("N/A", seconds));
  EXPECT_FALSE(DurationProber::parseDuration("0.000000", seconds));
  EXPECT_FALSE(DurationProber::parseDuration("-4.2", seconds));
  EXPECT_FALSE(DurationProber::parseDuration("duration=10", seconds));
  EXPECT_FALSE(DurationProber::parseDuration(".", seconds));
  EXPECT_FALSE(DurationProber::parseDuration("1-2", seconds));
  EXPECT_FALSE(DurationProber::parseDuration("3e", seconds));
  EXPECT_FALSE(DurationProber::parseDuration("1.2.3", seconds));
  EXPECT_FALSE(DurationProber::parseDuration("10.5 10.5", seconds));

  // Left untouched by every failed parse
  EXPECT_DOUBLE_EQ(seconds, 42.0);
}

TEST_F(DurationProberTest, ReadsContainerDuration)
{
  const juce::File clip = media("clip.mp4", 10.0);

  double duration = 0.0;
  const juce::Result result = prober.probeDuration(clip, duration);

  ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
  EXPECT_NEAR(duration, 10.0, 1e-6);

  const auto commands = executor.getCommands();
  ASSERT_EQ(commands.size(), 1);
  EXPECT_EQ(commands[0][0], "ffprobe");
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(commands[0], "-show_entries"), "format=duration");
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(commands[0], "-of"), "csv=p=0");
  EXPECT_EQ(commands[0][commands[0].size() - 1], clip.getFullPathName());
}

TEST_F(DurationProberTest, MissingFileIsAnErrorWithoutRunningFFprobe)
{
  double duration = 7.0;
  const juce::Result result = prober.probeDuration(workDir.getChildFile("nope.mp4"), duration);

  EXPECT_TRUE(result.failed());
  EXPECT_TRUE(result.getErrorMessage().contains("nope.mp4"));
  EXPECT_DOUBLE_EQ(duration, 7.0);
  EXPECT_EQ(executor.getCommands().size(), 0);
}

TEST_F(DurationProberTest, NotAvailableDurationIsAnErrorNotZero)
{
  const juce::File stream = workDir.getChildFile("stream.ts");
  FakeFFmpegExecutor::writeMediaWithProbeOutput(stream, "N/A");

  double duration = 5.0;
  const juce::Result result = prober.probeDuration(stream, duration);

  EXPECT_TRUE(result.failed());
  EXPECT_TRUE(result.getErrorMessage().contains("N/A"));
  EXPECT_DOUBLE_EQ(duration, 5.0);
}

TEST_F(DurationProberTest, ZeroDurationIsAnError)
{
  const juce::File empty = media("empty.mp3", 0.0);

  double duration = 0.0;
  EXPECT_TRUE(prober.probeDuration(empty, duration).failed());
}

TEST_F(DurationProberTest, NonZeroExitCarriesDiagnostics)
{
  const juce::File clip = media("clip.mp4", 10.0);
  executor.setProbeFails(true);

  double duration = 0.0;
  const juce::Result result = prober.probeDuration(clip, duration);

  ASSERT_TRUE(result.failed());
  EXPECT_TRUE(result.getErrorMessage().contains("clip.mp4"));
  EXPECT_TRUE(result.getErrorMessage().contains("Invalid data found"));
}

TEST_F(DurationProberTest, CountsAudioStreams)
{
  const juce::File silent = media("silent.mp4", 10.0, 0);
  const juce::File dual = media("dual.mp4", 10.0, 2);

  int count = -1;
  ASSERT_TRUE(prober.countAudioStreams(silent, count).wasOk());
  EXPECT_EQ(count, 0);

  ASSERT_TRUE(prober.countAudioStreams(dual, count).wasOk());
  EXPECT_EQ(count, 2);

  const auto commands = executor.getCommands();
  EXPECT_EQ(FakeFFmpegExecutor::getOptionValue(commands.getLast(), "-select_streams"), "a");
}

TEST_F(DurationProberTest, VerifyDurationAppliesTolerance)
{
  const juce::File clip = media("clip.mp4", 25.03);

  EXPECT_TRUE(prober.verifyDuration(clip, 25.0, 0.05).wasOk());

  const juce::Result tooLong = prober.verifyDuration(clip, 24.0, 0.05);
  EXPECT_TRUE(tooLong.failed());
  EXPECT_TRUE(tooLong.getErrorMessage().contains("expected 24.000s"));
}
