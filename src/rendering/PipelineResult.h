#pragma once
#include <juce_core/juce_core.h>

/**
 * Outcome of a pipeline operation.
 *
 * Follows the shape of juce::Result, but a success carries the produced file
 * and a failure carries an ErrorKind plus the diagnostic output captured from
 * the failing FFmpeg/FFprobe invocation.
 */
class PipelineResult
{
public:
    enum class ErrorKind
    {
        None,
        InvalidArgument,
        Workspace,
        Probe,
        Reconciliation,
        Padding,
        BackgroundPrep,
        Mix,
        Cancelled
    };

    static PipelineResult ok(const juce::File& outputFile);

    static PipelineResult fail(ErrorKind kind,
                               const juce::String& errorMessage,
                               const juce::String& diagnostics = {});

    bool wasOk() const noexcept     { return kind == ErrorKind::None; }
    bool failed() const noexcept    { return kind != ErrorKind::None; }
    explicit operator bool() const noexcept { return wasOk(); }

    /** The produced file. Empty for failures. */
    const juce::File& getOutputFile() const noexcept    { return outputFile; }

    ErrorKind getErrorKind() const noexcept             { return kind; }
    const juce::String& getErrorMessage() const noexcept { return errorMessage; }
    const juce::String& getDiagnostics() const noexcept  { return diagnostics; }

    /** Message and diagnostics in one block, suitable for a log or a terminal. */
    juce::String describe() const;

    static juce::String getErrorKindName(ErrorKind kind);

private:
    PipelineResult() = default;

    ErrorKind kind = ErrorKind::None;
    juce::File outputFile;
    juce::String errorMessage;
    juce::String diagnostics;
};
