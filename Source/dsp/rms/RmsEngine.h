/*
  ==============================================================================

    RmsEngine.h
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#pragma once

#include "../../audio/SampleBuffer.h"
#include "../Cancellation.h"
#include "LazyValue.h"
#include <memory>
#include <optional>
#include <vector>

namespace SessionScope::dsp
{

using SampleRange = juce::Range<juce::int64>;

/** Loudest single sample in the buffer. */
struct PeakMarker
{
    juce::int64 sampleIndex = -1;
    int channel = -1;
    float amplitude = 0.0f;   // signed sample value
    float db = 0.0f;          // -inf for digital silence
};

/** Centre of the loudest RMS window (averaged across channels in power). */
struct RmsMaxMarker
{
    juce::int64 sampleIndex = -1;
    float db = 0.0f;
    float amplitude = 0.0f;   // linear RMS
};

/** Running sum of squares per channel: cs[0] = 0, cs[k] = sum(x[0..k)^2). */
using CumulativeSums = std::vector<std::vector<double>>;

/** Windowed RMS downsampled to one value per pixel. */
struct RmsEnvelope
{
    int width = 0;
    int window = 0;
    SampleRange view;
    std::vector<std::vector<float>> channels;
    std::vector<float> combined;

    bool isEmpty() const noexcept { return channels.empty(); }
};

//==============================================================================
/**
    Windowed RMS analysis built on per-channel cumulative sums.

    The cumulative sums are computed once per buffer (normally by the load task)
    and are independent of the window length, so window changes only re-derive
    the envelope and the RMS-max marker.

    Interactive thread only. The static helpers are pure and are what the
    background load task runs.
*/
class RmsEngine
{
public:
    RmsEngine() = default;

    /** Switches to a new buffer. Sums, envelope and both markers become dirty. */
    void setBuffer (SampleBuffer::Ptr buffer);
    void clear();

    /** Window length in samples (<= 0 disables RMS). Re-dirties the RMS-max marker. */
    void setWindow (int windowSamples);
    int getWindow() const noexcept { return window_; }

    /** Adopts results computed in the background for the current buffer.
        rmsMax is only adopted if it was computed for the current window.
    */
    void installPrecomputed (std::shared_ptr<const CumulativeSums> sums,
                             std::optional<PeakMarker> peak,
                             int rmsMaxWindow,
                             std::optional<RmsMaxMarker> rmsMax);

    /** Per-channel and combined envelope for the view at the given pixel width.
        Cached by (width, view, window).
    */
    const RmsEnvelope& getEnvelope (SampleRange view, int width);

    std::optional<PeakMarker> getPeakMarker();
    std::optional<RmsMaxMarker> getRmsMaxMarker();

    bool isPeakMarkerDirty() const noexcept   { return peak_.isDirty(); }
    bool isRmsMaxMarkerDirty() const noexcept { return rmsMax_.isDirty(); }
    bool hasCumulativeSums() const noexcept   { return sums_ != nullptr; }

    //==============================================================================
    /** Builds the cumulative sums for every channel.
        Returns nullptr if cancelled.
    */
    static std::shared_ptr<const CumulativeSums> buildCumulativeSums (const SampleBuffer& buffer,
                                                                      const ShouldCancel& shouldCancel = {});

    /** Windowed mean square starting at offset k: (cs[k + window] - cs[k]) / window.
        Channels with n <= window yield a single zero point.
    */
    static double windowedMeanSquare (const std::vector<double>& sums, int window, juce::int64 k) noexcept;

    /** Number of windowed mean-square values of one channel (1 for degenerate channels). */
    static juce::int64 numWindowedValues (const std::vector<double>& sums, int window) noexcept;

    static std::optional<PeakMarker> findPeak (const SampleBuffer& buffer,
                                               const ShouldCancel& shouldCancel = {});

    /** Whole-buffer search; std::nullopt when window <= 0, no channels, or cancelled. */
    static std::optional<RmsMaxMarker> findRmsMax (const CumulativeSums& sums,
                                                   int window,
                                                   const ShouldCancel& shouldCancel = {});

    /** 20*log10(gain), -inf for zero. */
    static float gainToDb (double gain) noexcept;

private:
    const CumulativeSums& ensureCumulativeSums();
    void resetEnvelope();

    SampleBuffer::Ptr buffer_;
    std::shared_ptr<const CumulativeSums> sums_;
    int window_ = 0;

    RmsEnvelope envelope_;
    bool envelopeValid_ = false;

    LazyValue<std::optional<PeakMarker>> peak_;
    LazyValue<std::optional<RmsMaxMarker>> rmsMax_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (RmsEngine)
};

} // namespace SessionScope::dsp
