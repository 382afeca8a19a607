#include "TestSignals.h"
#include "analyzer/ComputeWorker.h"

using namespace SessionScope;

namespace
{
    constexpr int kTimeoutMs = 30000;

    LoadRequest makeLoadRequest (SampleBuffer::Ptr buffer, uint32_t generation)
    {
        LoadRequest request;
        request.generation = generation;
        request.buffer = std::move (buffer);
        request.rmsWindow = 4410;
        return request;
    }

    SpectrogramRequest makeSpectrogramRequest (SampleBuffer::Ptr buffer, int fftSize)
    {
        SpectrogramRequest request;
        request.generation = 1;
        request.buffer = std::move (buffer);
        request.fftParams.fftSize = fftSize;
        return request;
    }
}

TEST_CASE ("ComputeWorker load task body computes every stage", "[worker]")
{
    auto buffer = test::makeBuffer ({ test::sine (44100, 440.0, 44100.0), test::noise (44100, 31, 0.1f) }, 44100);

    const auto result = ComputeWorker::runLoad (makeLoadRequest (buffer, 7), {});

    REQUIRE (result.has_value());
    CHECK (result->generation == 7);
    CHECK (result->buffer == buffer);
    CHECK (result->peak.has_value());
    REQUIRE (result->cumulativeSums != nullptr);
    CHECK (result->cumulativeSums->size() == 2);
    CHECK (result->rmsWindow == 4410);
    CHECK (result->rmsMax.has_value());
    REQUIRE (result->spectrogram != nullptr);
    CHECK (result->spectrogram->params == result->fftParams);
}

TEST_CASE ("ComputeWorker load task body yields nothing when cancelled", "[worker][cancel]")
{
    auto buffer = test::makeBuffer ({ test::noise (44100, 32) }, 44100);
    CHECK_FALSE (ComputeWorker::runLoad (makeLoadRequest (buffer, 1), [] { return true; }).has_value());
    CHECK_FALSE (ComputeWorker::runSpectrogram (makeSpectrogramRequest (buffer, 2048), [] { return true; }).has_value());
}

TEST_CASE ("ComputeWorker delivers results on dispatch only", "[worker]")
{
    auto buffer = test::makeBuffer ({ test::noise (88200, 33) }, 44100);

    ComputeWorker worker;
    int loads = 0;
    uint32_t deliveredGeneration = 0;
    worker.onLoadComplete = [&] (const LoadResult& r)
    {
        ++loads;
        deliveredGeneration = r.generation;
    };

    worker.startLoad (makeLoadRequest (buffer, 3));
    REQUIRE (worker.waitForIdle (kTimeoutMs));

    CHECK (loads == 0);
    CHECK (worker.hasPendingResults());

    CHECK (worker.dispatchCompleted() == 1);
    CHECK (loads == 1);
    CHECK (deliveredGeneration == 3);

    CHECK (worker.dispatchCompleted() == 0);
    CHECK (loads == 1);
}

TEST_CASE ("ComputeWorker new recompute supersedes the previous one", "[worker][cancel]")
{
    auto buffer = test::makeBuffer ({ test::noise (44100 * 10, 34) }, 44100);

    ComputeWorker worker;
    std::vector<int> delivered;
    worker.onSpectrogramReady = [&] (const SpectrogramResult& r) { delivered.push_back (r.fftParams.fftSize); };

    worker.startSpectrogram (makeSpectrogramRequest (buffer, 512));
    worker.startSpectrogram (makeSpectrogramRequest (buffer, 4096));
    REQUIRE (worker.waitForIdle (kTimeoutMs));

    worker.dispatchCompleted();

    REQUIRE (delivered.size() == 1);
    CHECK (delivered.front() == 4096);
}

TEST_CASE ("ComputeWorker new load supersedes the previous one", "[worker][cancel]")
{
    auto first = test::makeBuffer ({ test::noise (44100 * 5, 35) }, 44100);
    auto second = test::makeBuffer ({ test::noise (44100, 36) }, 44100);

    ComputeWorker worker;
    std::vector<uint32_t> generations;
    worker.onLoadComplete = [&] (const LoadResult& r) { generations.push_back (r.generation); };

    worker.startLoad (makeLoadRequest (first, 1));
    worker.startLoad (makeLoadRequest (second, 2));
    REQUIRE (worker.waitForIdle (kTimeoutMs));
    worker.dispatchCompleted();

    REQUIRE (generations.size() == 1);
    CHECK (generations.front() == 2);
}

TEST_CASE ("ComputeWorker cancelAll drops everything", "[worker][cancel]")
{
    auto buffer = test::makeBuffer ({ test::noise (44100 * 5, 37) }, 44100);

    ComputeWorker worker;
    int calls = 0;
    worker.onLoadComplete = [&] (const LoadResult&) { ++calls; };
    worker.onSpectrogramReady = [&] (const SpectrogramResult&) { ++calls; };

    worker.startLoad (makeLoadRequest (buffer, 1));
    worker.startSpectrogram (makeSpectrogramRequest (buffer, 1024));
    worker.cancelAll();

    REQUIRE (worker.waitForIdle (kTimeoutMs));
    CHECK_FALSE (worker.isBusy());
    CHECK (worker.dispatchCompleted() == 0);
    CHECK (calls == 0);
}

TEST_CASE ("ComputeWorker can be destroyed while a task is running", "[worker][cancel]")
{
    auto buffer = test::makeBuffer ({ test::noise (44100 * 20, 38), test::noise (44100 * 20, 39) }, 44100);
    int calls = 0;

    {
        ComputeWorker worker;
        worker.onLoadComplete = [&] (const LoadResult&) { ++calls; };
        worker.onSpectrogramReady = [&] (const SpectrogramResult&) { ++calls; };

        worker.startLoad (makeLoadRequest (buffer, 1));
        worker.startSpectrogram (makeSpectrogramRequest (buffer, 512));
        CHECK (worker.isBusy());
    }

    CHECK (calls == 0);
}
