#include "PipelineResult.h"

PipelineResult PipelineResult::ok(const juce::File& outputFile)
{
    PipelineResult result;
    result.outputFile = outputFile;
    return result;
}

PipelineResult PipelineResult::fail(ErrorKind kind,
                                    const juce::String& errorMessage,
                                    const juce::String& diagnostics)
{
    // A failure without a kind would read as success
    jassert(kind != ErrorKind::None);

    PipelineResult result;
    result.kind = (kind == ErrorKind::None) ? ErrorKind::InvalidArgument : kind;
    result.errorMessage = errorMessage.isNotEmpty() ? errorMessage : juce::String("Unknown error");
    result.diagnostics = diagnostics;
    return result;
}

juce::String PipelineResult::describe() const
{
    if (wasOk())
        return "OK: " + outputFile.getFullPathName();

    juce::String text = getErrorKindName(kind) + ": " + errorMessage;

    if (diagnostics.trim().isNotEmpty())
        text << "\n" << diagnostics.trim();

    return text;
}

juce::String PipelineResult::getErrorKindName(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::None:            return "None";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::Workspace:       return "WorkspaceError";
        case ErrorKind::Probe:           return "ProbeError";
        case ErrorKind::Reconciliation:  return "ReconciliationError";
        case ErrorKind::Padding:         return "PaddingError";
        case ErrorKind::BackgroundPrep:  return "BackgroundPrepError";
        case ErrorKind::Mix:             return "MixError";
        case ErrorKind::Cancelled:       return "Cancelled";
    }

    return "Unknown";
}
