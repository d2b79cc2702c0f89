#include "PipelineConfig.h"

namespace
{
    namespace Ids
    {
        const juce::Identifier ffmpegPath ("ffmpegPath");
        const juce::Identifier ffprobePath ("ffprobePath");
        const juce::Identifier closenessTolerance ("closenessTolerance");
        const juce::Identifier durationTolerance ("durationTolerance");
        const juce::Identifier fadeDuration ("fadeDuration");
        const juce::Identifier defaultVoiceDelay ("defaultVoiceDelay");
        const juce::Identifier defaultVoiceVolume ("defaultVoiceVolume");
        const juce::Identifier defaultMusicVolume ("defaultMusicVolume");
        const juce::Identifier scratchDirectoryName ("scratchDirectoryName");
        const juce::Identifier stripAudioInPassThrough ("stripAudioInPassThrough");
        const juce::Identifier verifyOutputDurations ("verifyOutputDurations");
        const juce::Identifier logDirectory ("logDirectory");
        const juce::Identifier VideoProfile ("VideoProfile");
        const juce::Identifier frameRate ("frameRate");
        const juce::Identifier pixelFormat ("pixelFormat");
        const juce::Identifier videoCodec ("videoCodec");
        const juce::Identifier preset ("preset");
        const juce::Identifier crf ("crf");
        const juce::Identifier fastStart ("fastStart");
    }

    template <typename Type>
    Type readProperty(const juce::ValueTree& tree, const juce::Identifier& id, Type fallback)
    {
        if (!tree.hasProperty(id))
            return fallback;

        return static_cast<Type>(tree.getProperty(id));
    }

    juce::String readString(const juce::ValueTree& tree, const juce::Identifier& id, const juce::String& fallback)
    {
        if (!tree.hasProperty(id))
            return fallback;

        return tree.getProperty(id).toString();
    }
}

const juce::Identifier PipelineConfig::treeType("QuoteClipConfig");

//==============================================================================
juce::StringArray VideoProfile::toArguments() const
{
    juce::StringArray args;
    args.add("-r");        args.add(juce::String(frameRate));
    args.add("-pix_fmt");  args.add(pixelFormat);
    args.add("-c:v");      args.add(videoCodec);
    args.add("-preset");   args.add(preset);
    args.add("-crf");      args.add(juce::String(crf));

    if (fastStart)
    {
        args.add("-movflags");
        args.add("+faststart");
    }

    return args;
}

//==============================================================================
juce::ValueTree PipelineConfig::toValueTree() const
{
    juce::ValueTree tree(treeType);

    tree.setProperty(Ids::ffmpegPath, ffmpegPath, nullptr);
    tree.setProperty(Ids::ffprobePath, ffprobePath, nullptr);
    tree.setProperty(Ids::closenessTolerance, closenessTolerance, nullptr);
    tree.setProperty(Ids::durationTolerance, durationTolerance, nullptr);
    tree.setProperty(Ids::fadeDuration, fadeDuration, nullptr);
    tree.setProperty(Ids::defaultVoiceDelay, defaultVoiceDelay, nullptr);
    tree.setProperty(Ids::defaultVoiceVolume, defaultVoiceVolume, nullptr);
    tree.setProperty(Ids::defaultMusicVolume, defaultMusicVolume, nullptr);
    tree.setProperty(Ids::scratchDirectoryName, scratchDirectoryName, nullptr);
    tree.setProperty(Ids::stripAudioInPassThrough, stripAudioInPassThrough, nullptr);
    tree.setProperty(Ids::verifyOutputDurations, verifyOutputDurations, nullptr);
    tree.setProperty(Ids::logDirectory, logDirectory.getFullPathName(), nullptr);

    juce::ValueTree profile(Ids::VideoProfile);
    profile.setProperty(Ids::frameRate, videoProfile.frameRate, nullptr);
    profile.setProperty(Ids::pixelFormat, videoProfile.pixelFormat, nullptr);
    profile.setProperty(Ids::videoCodec, videoProfile.videoCodec, nullptr);
    profile.setProperty(Ids::preset, videoProfile.preset, nullptr);
    profile.setProperty(Ids::crf, videoProfile.crf, nullptr);
    profile.setProperty(Ids::fastStart, videoProfile.fastStart, nullptr);
    tree.addChild(profile, -1, nullptr);

    return tree;
}

PipelineConfig PipelineConfig::fromValueTree(const juce::ValueTree& tree)
{
    PipelineConfig config;

    if (!tree.isValid() || !tree.hasType(treeType))
        return config;

    config.ffmpegPath = readString(tree, Ids::ffmpegPath, config.ffmpegPath);
    config.ffprobePath = readString(tree, Ids::ffprobePath, config.ffprobePath);
    config.closenessTolerance = readProperty(tree, Ids::closenessTolerance, config.closenessTolerance);
    config.durationTolerance = readProperty(tree, Ids::durationTolerance, config.durationTolerance);
    config.fadeDuration = readProperty(tree, Ids::fadeDuration, config.fadeDuration);
    config.defaultVoiceDelay = readProperty(tree, Ids::defaultVoiceDelay, config.defaultVoiceDelay);
    config.defaultVoiceVolume = readProperty(tree, Ids::defaultVoiceVolume, config.defaultVoiceVolume);
    config.defaultMusicVolume = readProperty(tree, Ids::defaultMusicVolume, config.defaultMusicVolume);
    config.scratchDirectoryName = readString(tree, Ids::scratchDirectoryName, config.scratchDirectoryName);
    config.stripAudioInPassThrough = readProperty(tree, Ids::stripAudioInPassThrough, config.stripAudioInPassThrough);
    config.verifyOutputDurations = readProperty(tree, Ids::verifyOutputDurations, config.verifyOutputDurations);

    const juce::String logDir = readString(tree, Ids::logDirectory, {});
    if (juce::File::isAbsolutePath(logDir))
        config.logDirectory = juce::File(logDir);

    const juce::ValueTree profile = tree.getChildWithName(Ids::VideoProfile);
    if (profile.isValid())
    {
        auto& vp = config.videoProfile;
        vp.frameRate = readProperty(profile, Ids::frameRate, vp.frameRate);
        vp.pixelFormat = readString(profile, Ids::pixelFormat, vp.pixelFormat);
        vp.videoCodec = readString(profile, Ids::videoCodec, vp.videoCodec);
        vp.preset = readString(profile, Ids::preset, vp.preset);
        vp.crf = readProperty(profile, Ids::crf, vp.crf);
        vp.fastStart = readProperty(profile, Ids::fastStart, vp.fastStart);
    }

    return config;
}

//==============================================================================
juce::Result PipelineConfig::loadFromFile(const juce::File& file, PipelineConfig& target)
{
    if (!file.existsAsFile())
        return juce::Result::fail("Config file does not exist: " + file.getFullPathName());

    const juce::String xmlContent = file.loadFileAsString();
    const juce::ValueTree tree = juce::ValueTree::fromXml(xmlContent);

    if (!tree.isValid())
        return juce::Result::fail("Failed to parse config file. Invalid XML format: " + file.getFullPathName());

    if (!tree.hasType(treeType))
        return juce::Result::fail("Unexpected config root <" + tree.getType().toString()
                                  + ">, expected <" + treeType.toString() + ">");

    PipelineConfig loaded = fromValueTree(tree);

    const juce::Result validation = loaded.validate();
    if (validation.failed())
        return validation;

    target = loaded;
    return juce::Result::ok();
}

juce::Result PipelineConfig::saveToFile(const juce::File& file) const
{
    std::unique_ptr<juce::XmlElement> xml(toValueTree().createXml());
    if (xml == nullptr)
        return juce::Result::fail("Failed to serialise config");

    if (!xml->writeTo(file))
        return juce::Result::fail("Failed to write config file: " + file.getFullPathName());

    return juce::Result::ok();
}

juce::Result PipelineConfig::validate() const
{
    if (!(closenessTolerance >= 0.0))
        return juce::Result::fail("closenessTolerance must not be negative");

    if (!(durationTolerance > 0.0))
        return juce::Result::fail("durationTolerance must be positive");

    if (!(fadeDuration >= 0.0))
        return juce::Result::fail("fadeDuration must not be negative");

    if (!(defaultVoiceDelay >= 0.0))
        return juce::Result::fail("defaultVoiceDelay must not be negative");

    if (!(defaultVoiceVolume >= 0.0 && defaultVoiceVolume <= 1.0)
        || !(defaultMusicVolume >= 0.0 && defaultMusicVolume <= 1.0))
        return juce::Result::fail("Default volumes must be within 0..1");

    if (videoProfile.frameRate <= 0)
        return juce::Result::fail("videoProfile.frameRate must be positive");

    if (scratchDirectoryName.trim().isEmpty()
        || scratchDirectoryName.containsAnyOf("/\\"))
        return juce::Result::fail("scratchDirectoryName must be a plain directory name");

    return juce::Result::ok();
}
