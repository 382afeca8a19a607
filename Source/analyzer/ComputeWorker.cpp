/*
  ==============================================================================

    ComputeWorker.cpp
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#include "ComputeWorker.h"
#include "../config/DevFlags.h"

namespace SessionScope
{

namespace
{
    constexpr int kShutdownTimeoutMs = 10000;
}

//==============================================================================
class ComputeWorker::FullLoadJob : public juce::ThreadPoolJob
{
public:
    FullLoadJob (ComputeWorker& owner, uint32_t ticket, LoadRequest request)
        : juce::ThreadPoolJob ("SessionScope full load"),
          owner_ (owner), ticket_ (ticket), request_ (std::move (request))
    {
    }

    JobStatus runJob() override
    {
        auto result = runLoad (request_, [this] { return shouldExit(); });

        if (result.has_value() && ! shouldExit())
            owner_.postLoad (ticket_, std::move (*result));
        else
            DBG ("ComputeWorker: load task cancelled (generation " << juce::String (request_.generation) << ")");

        return jobHasFinished;
    }

private:
    ComputeWorker& owner_;
    const uint32_t ticket_;
    const LoadRequest request_;
};

class ComputeWorker::SpectrogramJob : public juce::ThreadPoolJob
{
public:
    SpectrogramJob (ComputeWorker& owner, uint32_t ticket, SpectrogramRequest request)
        : juce::ThreadPoolJob ("SessionScope spectrogram"),
          owner_ (owner), ticket_ (ticket), request_ (std::move (request))
    {
    }

    JobStatus runJob() override
    {
        auto result = runSpectrogram (request_, [this] { return shouldExit(); });

        if (result.has_value() && ! shouldExit())
            owner_.postSpectrogram (ticket_, std::move (*result));
        else
            DBG ("ComputeWorker: spectrogram task cancelled (fft " << request_.fftParams.fftSize << ")");

        return jobHasFinished;
    }

private:
    ComputeWorker& owner_;
    const uint32_t ticket_;
    const SpectrogramRequest request_;
};

//==============================================================================
ComputeWorker::ComputeWorker() = default;

ComputeWorker::~ComputeWorker()
{
    // Jobs hold a reference to this object; wait for them before members go
    {
        const juce::ScopedLock sl (mailboxLock_);
        ++loadTicket_;
        ++spectrogramTicket_;
    }

    loadPool_.removeAllJobs (true, kShutdownTimeoutMs);
    spectrogramPool_.removeAllJobs (true, kShutdownTimeoutMs);
}

void ComputeWorker::startLoad (LoadRequest request)
{
    jassert (request.buffer != nullptr);

    // A new load supersedes both kinds: any recompute belongs to the old buffer
    cancelSpectrogram();
    cancelLoad();

    uint32_t ticket = 0;
    {
        const juce::ScopedLock sl (mailboxLock_);
        ticket = loadTicket_;
    }

    DBG ("ComputeWorker: starting load task (generation " << juce::String (request.generation) << ")");
    loadPool_.addJob (new FullLoadJob (*this, ticket, std::move (request)), true);
}

void ComputeWorker::startSpectrogram (SpectrogramRequest request)
{
    jassert (request.buffer != nullptr);

    cancelSpectrogram();

    uint32_t ticket = 0;
    {
        const juce::ScopedLock sl (mailboxLock_);
        ticket = spectrogramTicket_;
    }

    DBG ("ComputeWorker: starting spectrogram task (fft " << request.fftParams.fftSize
         << ", " << dsp::toString (request.fftParams.window) << ")");
    spectrogramPool_.addJob (new SpectrogramJob (*this, ticket, std::move (request)), true);
}

void ComputeWorker::cancelLoad()
{
    {
        const juce::ScopedLock sl (mailboxLock_);
        ++loadTicket_;
        pendingLoad_.reset();
    }

    // Signal the running job and drop queued ones without blocking
    loadPool_.removeAllJobs (true, 0);
}

void ComputeWorker::cancelSpectrogram()
{
    {
        const juce::ScopedLock sl (mailboxLock_);
        ++spectrogramTicket_;
        pendingSpectrogram_.reset();
    }

    spectrogramPool_.removeAllJobs (true, 0);
}

void ComputeWorker::cancelAll()
{
    cancelLoad();
    cancelSpectrogram();
}

void ComputeWorker::postLoad (uint32_t ticket, LoadResult&& result)
{
    const juce::ScopedLock sl (mailboxLock_);

    if (ticket != loadTicket_)
        return;

    pendingLoad_ = std::move (result);
}

void ComputeWorker::postSpectrogram (uint32_t ticket, SpectrogramResult&& result)
{
    const juce::ScopedLock sl (mailboxLock_);

    if (ticket != spectrogramTicket_)
        return;

    pendingSpectrogram_ = std::move (result);
}

int ComputeWorker::dispatchCompleted()
{
    std::optional<LoadResult> load;
    std::optional<SpectrogramResult> spectrogram;

    {
        const juce::ScopedLock sl (mailboxLock_);
        std::swap (load, pendingLoad_);
        std::swap (spectrogram, pendingSpectrogram_);
    }

    int delivered = 0;

    // Load first: a recompute result is only meaningful on top of its buffer
    if (load.has_value())
    {
        ++delivered;
        if (onLoadComplete != nullptr)
            onLoadComplete (*load);
    }

    if (spectrogram.has_value())
    {
        ++delivered;
        if (onSpectrogramReady != nullptr)
            onSpectrogramReady (*spectrogram);
    }

    return delivered;
}

bool ComputeWorker::isBusy() const
{
    return loadPool_.getNumJobs() > 0 || spectrogramPool_.getNumJobs() > 0;
}

bool ComputeWorker::hasPendingResults() const
{
    const juce::ScopedLock sl (mailboxLock_);
    return pendingLoad_.has_value() || pendingSpectrogram_.has_value();
}

bool ComputeWorker::waitForIdle (int timeoutMs) const
{
    const auto deadline = juce::Time::getMillisecondCounter() + static_cast<juce::uint32> (juce::jmax (0, timeoutMs));

    while (isBusy())
    {
        if (juce::Time::getMillisecondCounter() >= deadline)
            return false;

        juce::Thread::sleep (2);
    }

    return true;
}

//==============================================================================
std::optional<LoadResult> ComputeWorker::runLoad (const LoadRequest& request, const dsp::ShouldCancel& shouldCancel)
{
    jassert (request.buffer != nullptr);
    const auto& buffer = *request.buffer;

    LoadResult result;
    result.generation = request.generation;
    result.buffer = request.buffer;
    result.rmsWindow = request.rmsWindow;
    result.fftParams = request.fftParams;
    result.melOptions = request.melOptions;

    // Stage 1: peak marker
    result.peak = dsp::RmsEngine::findPeak (buffer, shouldCancel);
    if (dsp::isCancelled (shouldCancel))
        return std::nullopt;

    // Stage 2: cumulative sums (window independent)
    result.cumulativeSums = dsp::RmsEngine::buildCumulativeSums (buffer, shouldCancel);
    if (result.cumulativeSums == nullptr || dsp::isCancelled (shouldCancel))
        return std::nullopt;

    // Stage 3: RMS-max marker for the window active at launch
    result.rmsMax = dsp::RmsEngine::findRmsMax (*result.cumulativeSums, request.rmsWindow, shouldCancel);
    if (dsp::isCancelled (shouldCancel))
        return std::nullopt;

    // Stage 4: mel spectrogram (nullptr is a valid "unavailable")
    result.spectrogram = dsp::MelSpectrogramEngine::compute (buffer, request.fftParams, request.melOptions, shouldCancel);
    if (dsp::isCancelled (shouldCancel))
        return std::nullopt;

    SESSIONSCOPE_LOG ("ComputeWorker: load task finished, generation " + juce::String (request.generation));

    return result;
}

std::optional<SpectrogramResult> ComputeWorker::runSpectrogram (const SpectrogramRequest& request,
                                                                const dsp::ShouldCancel& shouldCancel)
{
    jassert (request.buffer != nullptr);

    SpectrogramResult result;
    result.generation = request.generation;
    result.fftParams = request.fftParams;
    result.melOptions = request.melOptions;
    result.spectrogram = dsp::MelSpectrogramEngine::compute (*request.buffer, request.fftParams,
                                                             request.melOptions, shouldCancel);

    if (dsp::isCancelled (shouldCancel))
        return std::nullopt;

    return result;
}

} // namespace SessionScope
