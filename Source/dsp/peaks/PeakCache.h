/*
  ==============================================================================

    PeakCache.h
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#pragma once

#include "../../audio/SampleBuffer.h"
#include <vector>

namespace SessionScope::dsp
{

using SampleRange = juce::Range<juce::int64>;

/** Min/max envelope of one channel, one entry per horizontal pixel. */
struct ChannelPeaks
{
    std::vector<float> mins;
    std::vector<float> maxs;
};

struct PeakEntry
{
    int width = 0;
    SampleRange view;
    std::vector<ChannelPeaks> channels;

    bool isEmpty() const noexcept { return channels.empty(); }
};

//==============================================================================
/**
    Downsamples the visible part of every channel to one (min, max) pair per
    pixel.

    The last result is kept and reused:
    - identical (width, view) request: returned verbatim
    - horizontal scroll with unchanged width and view length: the overlapping
      pixels are shifted over and only the newly exposed fringe is read from
      the raw samples
    - anything else: full rebuild

    Interactive thread only.
*/
class PeakCache
{
public:
    enum class BuildKind
    {
        None,
        CacheHit,
        IncrementalShift,
        FullRebuild
    };

    PeakCache() = default;

    /** Returns peaks for view in [0, numSamples] at the given pixel width.
        The reference stays valid until the next call or invalidate().
    */
    const PeakEntry& getPeaks (const SampleBuffer& buffer, SampleRange view, int width);

    /** Drops the cached entry (new buffer, viewport resize). */
    void invalidate();

    /** How the most recent getPeaks() call was serviced. */
    BuildKind getLastBuildKind() const noexcept { return lastBuild_; }

    /** Min/max of samples [start, end) of one channel split into numBins runs. */
    static void computeRange (const float* channelData,
                              juce::int64 start,
                              juce::int64 end,
                              int numBins,
                              float* minsOut,
                              float* maxsOut);

private:
    bool tryIncrementalShift (const SampleBuffer& buffer, SampleRange view, int width);
    void rebuild (const SampleBuffer& buffer, SampleRange view, int width);

    PeakEntry entry_;
    BuildKind lastBuild_ = BuildKind::None;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (PeakCache)
};

} // namespace SessionScope::dsp
