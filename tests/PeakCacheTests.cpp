#include "TestSignals.h"
#include "dsp/peaks/PeakCache.h"

using namespace SessionScope;
using dsp::PeakCache;
using dsp::SampleRange;

namespace
{
    void requireSamePeaks (const dsp::PeakEntry& a, const dsp::PeakEntry& b)
    {
        REQUIRE (a.channels.size() == b.channels.size());

        for (std::size_t ch = 0; ch < a.channels.size(); ++ch)
        {
            REQUIRE (a.channels[ch].mins == b.channels[ch].mins);
            REQUIRE (a.channels[ch].maxs == b.channels[ch].maxs);
        }
    }
}

TEST_CASE ("PeakCache returns exactly width bins with min <= max", "[peaks]")
{
    auto buffer = test::makeBuffer ({ test::noise (10000, 1), test::noise (10000, 2) }, 44100);
    PeakCache cache;

    for (int width : { 1, 7, 333, 800, 10000, 25000 })
    {
        const auto& entry = cache.getPeaks (*buffer, { 0, 10000 }, width);

        REQUIRE (entry.channels.size() == 2);
        for (const auto& ch : entry.channels)
        {
            REQUIRE (ch.mins.size() == static_cast<std::size_t> (width));
            REQUIRE (ch.maxs.size() == static_cast<std::size_t> (width));

            for (std::size_t i = 0; i < ch.mins.size(); ++i)
                REQUIRE (ch.mins[i] <= ch.maxs[i]);
        }
    }
}

TEST_CASE ("PeakCache splits ten million samples into 800 runs of 12500", "[peaks][scenario]")
{
    std::vector<float> data (10000000, 0.0f);
    data[12499] = 1.0f;    // last sample of run 0
    data[12500] = -1.0f;   // first sample of run 1
    data[9999999] = 0.25f; // last sample of run 799

    auto buffer = test::makeBuffer ({ data }, 48000);
    PeakCache cache;

    const auto& entry = cache.getPeaks (*buffer, { 0, 10000000 }, 800);
    const auto& peaks = entry.channels.front();

    REQUIRE (peaks.maxs.size() == 800);
    CHECK (peaks.maxs[0] == 1.0f);
    CHECK (peaks.mins[0] == 0.0f);
    CHECK (peaks.mins[1] == -1.0f);
    CHECK (peaks.maxs[1] == 0.0f);
    CHECK (peaks.maxs[799] == 0.25f);
    CHECK (peaks.maxs[2] == 0.0f);
}

TEST_CASE ("PeakCache zoomed past one sample per pixel", "[peaks]")
{
    std::vector<float> data (200);
    for (std::size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<float> (i);

    auto buffer = test::makeBuffer ({ data }, 44100);
    PeakCache cache;

    // 10 samples over 20 pixels
    const auto& peaks = cache.getPeaks (*buffer, { 100, 110 }, 20).channels.front();

    REQUIRE (peaks.mins.size() == 20);
    CHECK (peaks.mins[0] == 0.0f);   // empty slot
    CHECK (peaks.maxs[0] == 0.0f);
    CHECK (peaks.mins[1] == 100.0f);
    CHECK (peaks.maxs[1] == 100.0f);
    CHECK (peaks.maxs[19] == 109.0f);
}

TEST_CASE ("PeakCache reports how a request was serviced", "[peaks][cache]")
{
    auto buffer = test::makeBuffer ({ test::noise (20000, 3), test::noise (20000, 4) }, 44100);
    PeakCache cache;

    // 8000 samples over 400 pixels: 20 samples per pixel
    cache.getPeaks (*buffer, { 0, 8000 }, 400);
    CHECK (cache.getLastBuildKind() == PeakCache::BuildKind::FullRebuild);

    SECTION ("Identical request is a cache hit")
    {
        cache.getPeaks (*buffer, { 0, 8000 }, 400);
        CHECK (cache.getLastBuildKind() == PeakCache::BuildKind::CacheHit);
    }

    SECTION ("One-pixel scroll takes the incremental path")
    {
        cache.getPeaks (*buffer, { 20, 8020 }, 400);
        CHECK (cache.getLastBuildKind() == PeakCache::BuildKind::IncrementalShift);
    }

    SECTION ("Width change forces a rebuild")
    {
        cache.getPeaks (*buffer, { 0, 8000 }, 401);
        CHECK (cache.getLastBuildKind() == PeakCache::BuildKind::FullRebuild);
    }

    SECTION ("Zoom forces a rebuild")
    {
        cache.getPeaks (*buffer, { 0, 4000 }, 400);
        CHECK (cache.getLastBuildKind() == PeakCache::BuildKind::FullRebuild);
    }

    SECTION ("Scrolling a full page forces a rebuild")
    {
        cache.getPeaks (*buffer, { 8000, 16000 }, 400);
        CHECK (cache.getLastBuildKind() == PeakCache::BuildKind::FullRebuild);
    }
}

TEST_CASE ("PeakCache incremental shift matches a full rebuild", "[peaks][cache]")
{
    auto buffer = test::makeBuffer ({ test::noise (20000, 5), test::sine (20000, 440.0, 44100.0) }, 44100);
    PeakCache cache;
    cache.getPeaks (*buffer, { 2000, 10000 }, 400);

    for (auto start : { 2020, 2120, 2100, 1000, 1020, 3000 })
    {
        const SampleRange view (start, start + 8000);
        const auto& shifted = cache.getPeaks (*buffer, view, 400);
        REQUIRE (cache.getLastBuildKind() == PeakCache::BuildKind::IncrementalShift);

        PeakCache fresh;
        requireSamePeaks (shifted, fresh.getPeaks (*buffer, view, 400));
    }
}

TEST_CASE ("PeakCache returns an empty entry for degenerate requests", "[peaks]")
{
    auto buffer = test::makeBuffer ({ test::noise (1000, 6) }, 44100);
    PeakCache cache;

    CHECK (cache.getPeaks (*buffer, { 0, 1000 }, 0).isEmpty());
    CHECK (cache.getPeaks (*buffer, { 500, 500 }, 100).isEmpty());
    CHECK (cache.getPeaks (*buffer, { 2000, 3000 }, 100).isEmpty());

    auto empty = test::makeBuffer ({}, 44100);
    CHECK (cache.getPeaks (*empty, { 0, 100 }, 100).isEmpty());
}

TEST_CASE ("PeakCache unaligned scroll keeps old columns and rounds the shift", "[peaks][cache]")
{
    auto buffer = test::makeBuffer ({ test::noise (20000, 6) }, 44100);
    PeakCache cache;

    // 20 samples per pixel
    const auto before = cache.getPeaks (*buffer, { 0, 8000 }, 400).channels.front();

    SECTION ("Fractional pixel shift is rounded and old columns are reused as is")
    {
        // 1003 samples = 50.15 pixels -> 50
        const SampleRange view (1003, 9003);
        const auto& after = cache.getPeaks (*buffer, view, 400).channels.front();
        REQUIRE (cache.getLastBuildKind() == PeakCache::BuildKind::IncrementalShift);

        for (std::size_t i = 0; i < 350; ++i)
        {
            REQUIRE (after.mins[i] == before.mins[i + 50]);
            REQUIRE (after.maxs[i] == before.maxs[i + 50]);
        }

        // Fresh columns cover [start + 350 * 20, end)
        PeakCache fringe;
        const auto& expected = fringe.getPeaks (*buffer, { 1003 + 7000, 9003 }, 50).channels.front();

        for (std::size_t i = 0; i < 50; ++i)
        {
            REQUIRE (after.mins[350 + i] == expected.mins[i]);
            REQUIRE (after.maxs[350 + i] == expected.maxs[i]);
        }
    }

    SECTION ("Half a pixel rounds to even: no shift, full rebuild")
    {
        cache.getPeaks (*buffer, { 10, 8010 }, 400);
        CHECK (cache.getLastBuildKind() == PeakCache::BuildKind::FullRebuild);
    }

    SECTION ("One and a half pixels rounds up to two")
    {
        const auto& after = cache.getPeaks (*buffer, { 30, 8030 }, 400).channels.front();
        REQUIRE (cache.getLastBuildKind() == PeakCache::BuildKind::IncrementalShift);
        CHECK (after.maxs[0] == before.maxs[2]);
    }

    SECTION ("Two and a half pixels rounds down to two")
    {
        const auto& after = cache.getPeaks (*buffer, { 50, 8050 }, 400).channels.front();
        REQUIRE (cache.getLastBuildKind() == PeakCache::BuildKind::IncrementalShift);
        CHECK (after.maxs[0] == before.maxs[2]);
        CHECK (after.mins[397] == before.mins[399]);
    }
}
