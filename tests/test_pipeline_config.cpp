// Unit tests for PipelineConfig XML persistence.

#include "fixtures/PipelineTestBase.h"

class PipelineConfigTest : public PipelineTestBase
{
protected:
  juce::File writeConfig(const juce::String& xml)
  {
    const juce::File file = workDir.getChildFile("quoteclip.xml");
    EXPECT_TRUE(file.replaceWithText(xml));
    return file;
  }
};

TEST(PipelineConfigDefaultsTest, MatchTheDocumentedConstants)
{
  const PipelineConfig config;

  EXPECT_DOUBLE_EQ(config.closenessTolerance, 1.0);
  EXPECT_DOUBLE_EQ(config.durationTolerance, 0.05);
  EXPECT_DOUBLE_EQ(config.fadeDuration, 1.5);
  EXPECT_DOUBLE_EQ(config.defaultVoiceDelay, 1.0);
  EXPECT_DOUBLE_EQ(config.defaultMusicVolume, 0.15);
  EXPECT_TRUE(config.stripAudioInPassThrough);
  EXPECT_FALSE(config.verifyOutputDurations);
  EXPECT_TRUE(config.validate().wasOk());

  EXPECT_EQ(config.videoProfile.toArguments().joinIntoString(" "),
            "-r 30 -pix_fmt yuv420p -c:v libx264 -preset veryfast -crf 18 -movflags +faststart");
}

TEST_F(PipelineConfigTest, MissingPropertiesKeepDefaults)
{
  const juce::File file = writeConfig("<QuoteClipConfig fadeDuration=\"2.5\" ffmpegPath=\"/opt/ffmpeg/bin/ffmpeg\">"
                                      "<VideoProfile crf=\"23\" fastStart=\"0\"/>"
                                      "</QuoteClipConfig>");

  PipelineConfig config;
  const juce::Result result = PipelineConfig::loadFromFile(file, config);

  ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
  EXPECT_DOUBLE_EQ(config.fadeDuration, 2.5);
  EXPECT_EQ(config.ffmpegPath, "/opt/ffmpeg/bin/ffmpeg");
  EXPECT_EQ(config.videoProfile.crf, 23);
  EXPECT_FALSE(config.videoProfile.fastStart);

  EXPECT_DOUBLE_EQ(config.closenessTolerance, 1.0);
  EXPECT_EQ(config.videoProfile.preset, "veryfast");
  EXPECT_EQ(config.scratchDirectoryName, ".quoteclip_work");
  EXPECT_FALSE(config.videoProfile.toArguments().contains("-movflags"));
}

TEST_F(PipelineConfigTest, SavedConfigLoadsBack)
{
  PipelineConfig original;
  original.closenessTolerance = 0.5;
  original.defaultMusicVolume = 0.2;
  original.verifyOutputDurations = true;
  original.videoProfile.preset = "medium";
  original.logDirectory = workDir.getChildFile("logs");

  const juce::File file = workDir.getChildFile("saved.xml");
  ASSERT_TRUE(original.saveToFile(file).wasOk());

  PipelineConfig loaded;
  ASSERT_TRUE(PipelineConfig::loadFromFile(file, loaded).wasOk());

  EXPECT_DOUBLE_EQ(loaded.closenessTolerance, 0.5);
  EXPECT_DOUBLE_EQ(loaded.defaultMusicVolume, 0.2);
  EXPECT_TRUE(loaded.verifyOutputDurations);
  EXPECT_EQ(loaded.videoProfile.preset, "medium");
  EXPECT_EQ(loaded.logDirectory, workDir.getChildFile("logs"));
}

TEST_F(PipelineConfigTest, InvalidXmlLeavesTargetUntouched)
{
  PipelineConfig config;
  config.fadeDuration = 4.0;

  const juce::Result result = PipelineConfig::loadFromFile(writeConfig("<QuoteClipConfig fadeDuration="), config);

  EXPECT_TRUE(result.failed());
  EXPECT_DOUBLE_EQ(config.fadeDuration, 4.0);
}

TEST_F(PipelineConfigTest, RejectsWrongRootAndInvalidValues)
{
  PipelineConfig config;

  EXPECT_TRUE(PipelineConfig::loadFromFile(writeConfig("<ProjectSettings/>"), config).failed());
  EXPECT_TRUE(PipelineConfig::loadFromFile(writeConfig("<QuoteClipConfig defaultMusicVolume=\"3\"/>"), config).failed());
  EXPECT_TRUE(PipelineConfig::loadFromFile(writeConfig("<QuoteClipConfig scratchDirectoryName=\"a/b\"/>"), config).failed());
  EXPECT_TRUE(PipelineConfig::loadFromFile(workDir.getChildFile("missing.xml"), config).failed());

  EXPECT_DOUBLE_EQ(config.defaultMusicVolume, 0.15);
}
