#pragma once
#include <juce_core/juce_core.h>

/**
 * Keeps track of every FFmpeg/FFprobe child process that is currently running,
 * so a front end that is shutting down can terminate them instead of leaving
 * orphaned encoders behind.
 *
 * Pipeline calls may run on several threads at once; every method locks.
 */
class ProcessRegistry
{
public:
    static ProcessRegistry& getInstance()
    {
        static ProcessRegistry instance;
        return instance;
    }

    void add(juce::ChildProcess* process, const juce::String& description)
    {
        const juce::ScopedLock sl(lock);
        entries.add({ process, description });
    }

    void remove(juce::ChildProcess* process)
    {
        const juce::ScopedLock sl(lock);
        entries.removeIf([process](const Entry& e) { return e.process == process; });
    }

    int size() const
    {
        const juce::ScopedLock sl(lock);
        return entries.size();
    }

    /**
     * Kills every registered process that is still running.
     * @return the number of processes that were killed
     */
    int terminateAll()
    {
        const juce::ScopedLock sl(lock);
        int killed = 0;

        for (const auto& e : entries)
        {
            if (e.process != nullptr && e.process->isRunning())
            {
                juce::Logger::writeToLog("Terminating " + e.description);
                e.process->kill();
                ++killed;
            }
        }

        entries.clear();
        return killed;
    }

private:
    struct Entry
    {
        juce::ChildProcess* process = nullptr;
        juce::String description;
    };

    ProcessRegistry() = default;

    juce::Array<Entry> entries;
    juce::CriticalSection lock;

    JUCE_DECLARE_NON_COPYABLE(ProcessRegistry)
};

/**
 * A ChildProcess that is listed in the ProcessRegistry for as long as it exists.
 */
class RegisteredChildProcess : public juce::ChildProcess
{
public:
    explicit RegisteredChildProcess(const juce::String& description)
    {
        ProcessRegistry::getInstance().add(this, description);
    }

    ~RegisteredChildProcess()
    {
        if (isRunning())
            kill();

        ProcessRegistry::getInstance().remove(this);
    }

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RegisteredChildProcess)
};
