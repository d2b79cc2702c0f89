#pragma once
#include <juce_core/juce_core.h>

/**
 * A per-invocation working directory for intermediate files.
 *
 * Lives at <outputDir>/<scratchName>/<outputStem>_<token>, where the token is
 * random, so two invocations writing next to each other never share a path.
 * The directory and everything in it is removed when this object is destroyed,
 * whichever way the owning operation returns. A failed removal is reported as
 * a cleanup warning and never turned into an error.
 */
class ScratchDirectory
{
public:
    ScratchDirectory(const juce::File& outputFile,
                     const juce::String& scratchName,
                     std::function<void(const juce::String&)> logCallback = nullptr);

    ~ScratchDirectory();

    /** False when the directory could not be created. */
    bool isValid() const noexcept { return valid; }

    /** Why creation failed, when it did. */
    const juce::Result& getCreationResult() const noexcept { return creationResult; }

    const juce::File& getDirectory() const noexcept { return directory; }

    /** A file inside the directory. The file itself is not created. */
    juce::File getFile(const juce::String& name) const;

private:
    void warn(const juce::String& message);

    juce::File root;
    juce::File directory;
    juce::Result creationResult { juce::Result::ok() };
    bool valid = false;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ScratchDirectory)
};
