#include "ScratchDirectory.h"

namespace
{
    // Serialises creating a directory under a shared root against removing that root
    juce::CriticalSection& getRootLock()
    {
        static juce::CriticalSection lock;
        return lock;
    }
}

ScratchDirectory::ScratchDirectory(const juce::File& outputFile,
                                   const juce::String& scratchName,
                                   std::function<void(const juce::String&)> callback)
    : logCallback(callback)
{
    root = outputFile.getParentDirectory().getChildFile(scratchName);

    const juce::String token = juce::Uuid().toString().substring(0, 12);

    const juce::ScopedLock sl(getRootLock());
    directory = root.getNonexistentChildFile(outputFile.getFileNameWithoutExtension() + "_" + token, {}, false);

    creationResult = directory.createDirectory();
    valid = creationResult.wasOk() && directory.isDirectory();

    if (!valid && creationResult.wasOk())
        creationResult = juce::Result::fail("Could not create " + directory.getFullPathName());
}

ScratchDirectory::~ScratchDirectory()
{
    if (directory.exists() && !directory.deleteRecursively())
        warn("CLEANUP WARNING: could not remove scratch directory " + directory.getFullPathName());

    // Only succeeds once the last concurrent invocation has gone
    const juce::ScopedLock sl(getRootLock());

    if (root.isDirectory() && root.getNumberOfChildFiles(juce::File::findFilesAndDirectories, "*") == 0)
        root.deleteFile();
}

juce::File ScratchDirectory::getFile(const juce::String& name) const
{
    return directory.getChildFile(name);
}

void ScratchDirectory::warn(const juce::String& message)
{
    juce::Logger::writeToLog(message);

    if (logCallback)
        logCallback(message);
}
