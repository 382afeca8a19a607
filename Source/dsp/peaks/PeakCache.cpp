/*
  ==============================================================================

    PeakCache.cpp
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#include "PeakCache.h"
#include "../../config/DevFlags.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace SessionScope::dsp
{

void PeakCache::computeRange (const float* channelData,
                              juce::int64 start,
                              juce::int64 end,
                              int numBins,
                              float* minsOut,
                              float* maxsOut)
{
    if (numBins <= 0)
        return;

    const juce::int64 n = end - start;
    const std::size_t numBinsSz = static_cast<std::size_t> (numBins);

    if (n <= 0)
    {
        std::fill (minsOut, minsOut + numBinsSz, 0.0f);
        std::fill (maxsOut, maxsOut + numBinsSz, 0.0f);
        return;
    }

    const float* data = channelData + start;

    if (n >= numBins)
    {
        // Segment reduce: run i covers [i*n/numBins, (i+1)*n/numBins)
        for (int i = 0; i < numBins; ++i)
        {
            const juce::int64 b0 = static_cast<juce::int64> (i) * n / numBins;
            const juce::int64 b1 = static_cast<juce::int64> (i + 1) * n / numBins;
            const auto range = juce::FloatVectorOperations::findMinAndMax (data + b0, static_cast<int> (b1 - b0));
            minsOut[i] = range.getStart();
            maxsOut[i] = range.getEnd();
        }
        return;
    }

    // Fewer samples than pixels: every pixel holds at most one sample.
    for (int i = 0; i < numBins; ++i)
    {
        const juce::int64 s = static_cast<juce::int64> (i) * n / numBins;
        const juce::int64 e = juce::jmin (static_cast<juce::int64> (i + 1) * n / numBins, n);

        if (e > s)
        {
            minsOut[i] = data[s];
            maxsOut[i] = data[s];
        }
        else
        {
            minsOut[i] = 0.0f;
            maxsOut[i] = 0.0f;
        }
    }
}

const PeakEntry& PeakCache::getPeaks (const SampleBuffer& buffer, SampleRange view, int width)
{
    const int numChannels = buffer.getNumChannels();
    view = view.getIntersectionWith ({ 0, buffer.getNumSamples() });

    if (numChannels == 0 || width <= 0 || view.isEmpty())
    {
        entry_ = PeakEntry{};
        lastBuild_ = BuildKind::FullRebuild;
        return entry_;
    }

    const bool sameShape = ! entry_.isEmpty()
                           && entry_.width == width
                           && static_cast<int> (entry_.channels.size()) == numChannels;

    if (sameShape && entry_.view == view)
    {
        lastBuild_ = BuildKind::CacheHit;
        return entry_;
    }

    if (sameShape && tryIncrementalShift (buffer, view, width))
    {
        lastBuild_ = BuildKind::IncrementalShift;
        return entry_;
    }

    rebuild (buffer, view, width);
    lastBuild_ = BuildKind::FullRebuild;
    return entry_;
}

void PeakCache::invalidate()
{
    entry_ = PeakEntry{};
    lastBuild_ = BuildKind::None;
}

bool PeakCache::tryIncrementalShift (const SampleBuffer& buffer, SampleRange view, int width)
{
    const juce::int64 viewLen = view.getLength();

    if (entry_.view.getLength() != viewLen || entry_.view.getStart() == view.getStart())
        return false;

    const juce::int64 shiftSamples = view.getStart() - entry_.view.getStart();
    // Round half to even
    const int shiftBins = static_cast<int> (std::lrint (static_cast<double> (shiftSamples) * width
                                                        / static_cast<double> (viewLen)));

    if (shiftBins == 0 || std::abs (shiftBins) >= width)
        return false;

    const int fringe = std::abs (shiftBins);
    const int keep = width - fringe;
    const std::size_t keepSz = static_cast<std::size_t> (keep);
    const std::size_t fringeSz = static_cast<std::size_t> (fringe);

    for (int ch = 0; ch < buffer.getNumChannels(); ++ch)
    {
        auto& peaks = entry_.channels[static_cast<std::size_t> (ch)];
        const float* data = buffer.getReadPointer (ch);

        if (shiftBins > 0)
        {
            // Scrolled right: old tail becomes new head, fresh samples on the right.
            std::move (peaks.mins.begin() + static_cast<std::ptrdiff_t> (fringeSz), peaks.mins.end(), peaks.mins.begin());
            std::move (peaks.maxs.begin() + static_cast<std::ptrdiff_t> (fringeSz), peaks.maxs.end(), peaks.maxs.begin());

            const juce::int64 fringeStart = view.getStart() + static_cast<juce::int64> (keep) * viewLen / width;
            computeRange (data, fringeStart, view.getEnd(), fringe,
                          peaks.mins.data() + keepSz, peaks.maxs.data() + keepSz);
        }
        else
        {
            // Scrolled left: old head becomes new tail, fresh samples on the left.
            std::move_backward (peaks.mins.begin(), peaks.mins.begin() + static_cast<std::ptrdiff_t> (keepSz), peaks.mins.end());
            std::move_backward (peaks.maxs.begin(), peaks.maxs.begin() + static_cast<std::ptrdiff_t> (keepSz), peaks.maxs.end());

            const juce::int64 fringeEnd = view.getStart() + static_cast<juce::int64> (fringe) * viewLen / width;
            computeRange (data, view.getStart(), fringeEnd, fringe,
                          peaks.mins.data(), peaks.maxs.data());
        }
    }

    SESSIONSCOPE_TRACE ("PeakCache shift=" + juce::String (shiftBins) + " bins, width=" + juce::String (width));

    entry_.view = view;
    return true;
}

void PeakCache::rebuild (const SampleBuffer& buffer, SampleRange view, int width)
{
    const int numChannels = buffer.getNumChannels();
    const std::size_t widthSz = static_cast<std::size_t> (width);

    entry_.width = width;
    entry_.view = view;
    entry_.channels.resize (static_cast<std::size_t> (numChannels));

    for (int ch = 0; ch < numChannels; ++ch)
    {
        auto& peaks = entry_.channels[static_cast<std::size_t> (ch)];
        peaks.mins.assign (widthSz, 0.0f);
        peaks.maxs.assign (widthSz, 0.0f);
        computeRange (buffer.getReadPointer (ch), view.getStart(), view.getEnd(), width,
                      peaks.mins.data(), peaks.maxs.data());
    }

    SESSIONSCOPE_TRACE ("PeakCache rebuild width=" + juce::String (width)
                        + " view=" + juce::String (view.getStart()) + ".." + juce::String (view.getEnd()));
}

} // namespace SessionScope::dsp
