/*
  ==============================================================================

    ComputeWorker.h
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#pragma once

#include "AnalysisResults.h"
#include <juce_core/juce_core.h>
#include <functional>
#include <optional>

namespace SessionScope
{

/** Inputs of a full-load task. */
struct LoadRequest
{
    uint32_t generation = 0;
    SampleBuffer::Ptr buffer;
    int rmsWindow = 0;
    dsp::FftParams fftParams;
    dsp::MelOptions melOptions;
};

/** Inputs of a spectrogram recompute. */
struct SpectrogramRequest
{
    uint32_t generation = 0;
    SampleBuffer::Ptr buffer;
    dsp::FftParams fftParams;
    dsp::MelOptions melOptions;
};

//==============================================================================
/**
    Runs the expensive whole-file analysis off the interactive thread.

    Each task kind owns a single-thread pool, so at most one task per kind runs
    at a time. Starting a task cancels the in-flight task of the same kind; a
    superseded task never publishes. Finished results wait in a mailbox until
    the interactive thread calls dispatchCompleted(), which fires the callbacks
    on that thread.
*/
class ComputeWorker
{
public:
    ComputeWorker();
    ~ComputeWorker();

    void startLoad (LoadRequest request);
    void startSpectrogram (SpectrogramRequest request);

    void cancelLoad();
    void cancelSpectrogram();
    void cancelAll();

    /** Delivers pending results through the callbacks. Interactive thread only.
        Returns the number of results delivered.
    */
    int dispatchCompleted();

    bool isBusy() const;
    bool hasPendingResults() const;

    /** Blocks until no task is queued or running. Returns false on timeout. */
    bool waitForIdle (int timeoutMs) const;

    // Callbacks (interactive thread, from dispatchCompleted)
    std::function<void (const LoadResult&)> onLoadComplete;
    std::function<void (const SpectrogramResult&)> onSpectrogramReady;

    //==============================================================================
    /** The task bodies, also usable synchronously. Return std::nullopt when cancelled. */
    static std::optional<LoadResult> runLoad (const LoadRequest& request, const dsp::ShouldCancel& shouldCancel);
    static std::optional<SpectrogramResult> runSpectrogram (const SpectrogramRequest& request, const dsp::ShouldCancel& shouldCancel);

private:
    class FullLoadJob;
    class SpectrogramJob;

    void postLoad (uint32_t ticket, LoadResult&& result);
    void postSpectrogram (uint32_t ticket, SpectrogramResult&& result);

    juce::CriticalSection mailboxLock_;
    uint32_t loadTicket_ = 0;
    uint32_t spectrogramTicket_ = 0;
    std::optional<LoadResult> pendingLoad_;
    std::optional<SpectrogramResult> pendingSpectrogram_;

    // Destroyed first: running jobs still post into the mailbox above
    juce::ThreadPool loadPool_ { 1 };
    juce::ThreadPool spectrogramPool_ { 1 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (ComputeWorker)
};

} // namespace SessionScope
