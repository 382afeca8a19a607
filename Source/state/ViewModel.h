/*
  ==============================================================================

    ViewModel.h
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include <optional>

namespace SessionScope::state
{

/**
    View state of one loaded track: visible sample range, frequency (mel)
    window, vertical amplitude scale and playback cursor.

    Responsibilities:
    - Zoom / scroll operations, always clamped to the buffer and the full
      displayable mel range (never empty, never inverted)
    - Pure pixel <-> sample / mel coordinate transforms

    Time-view operations return true when the visible sample range changed, so
    the caller knows to refresh the peak and RMS caches.
*/
class ViewModel
{
public:
    using SampleRange = juce::Range<juce::int64>;
    using MelRange = juce::Range<float>;

    static constexpr juce::int64 kMinViewLength = 100;
    static constexpr float kMinMelSpan = 50.0f;
    static constexpr float kMinVerticalScale = 0.1f;
    static constexpr float kMaxVerticalScale = 20.0f;
    static constexpr float kVerticalScaleStep = 1.5f;
    static constexpr int kPageDivisor = 8;

    ViewModel() = default;

    /** Resets everything for a newly loaded buffer (whole file, cursor at 0). */
    void reset (juce::int64 totalSamples, int sampleRate,
                float minFrequencyHz = 20.0f, float maxFrequencyHz = 22050.0f);

    // Accessors
    juce::int64 getTotalSamples() const noexcept { return totalSamples_; }
    int getSampleRate() const noexcept           { return sampleRate_; }
    SampleRange getViewRange() const noexcept    { return view_; }
    MelRange getMelView() const noexcept         { return melView_; }
    MelRange getFullMelRange() const noexcept    { return fullMel_; }
    float getVerticalScale() const noexcept      { return verticalScale_; }
    juce::int64 getCursor() const noexcept       { return cursor_; }

    // Time axis
    bool zoomIn();
    bool zoomOut();
    bool zoomAt (float anchorFraction, bool zoomIn);
    bool zoomFit();
    bool scroll (juce::int64 deltaSamples);
    bool scrollByPage (int direction);
    bool setViewRange (SampleRange newView);

    /** Moves the playback cursor. Pages the view forward when the cursor runs
        past the visible end. Returns true if the view moved.
    */
    bool setCursor (juce::int64 sample);

    // Frequency axis
    void freqZoom (float factor, std::optional<float> anchorMel = std::nullopt);
    void scrollFreq (float deltaMel);
    void resetFreqView();

    /** Replaces the displayable frequency limits (top capped at Nyquist) and
        clamps the current mel view into them.
    */
    void setFrequencyLimits (float minFrequencyHz, float maxFrequencyHz);

    // Amplitude axis
    void scaleUp();
    void scaleDown();
    void setVerticalScale (float scale);

    //==============================================================================
    int sampleToPixel (juce::int64 sample, int width) const noexcept;
    juce::int64 pixelToSample (float x, int width) const noexcept;

    /** Low mel values map to the bottom of the area. */
    float melToPixel (float mel, int height) const noexcept;
    float pixelToMel (float y, int height) const noexcept;
    float pixelToHz (float y, int height) const noexcept;

private:
    bool applyView (juce::int64 start, juce::int64 length);
    void applyMelView (float newMin, float newMax, float span);
    MelRange melRangeFor (float minFrequencyHz, float maxFrequencyHz) const noexcept;

    juce::int64 totalSamples_ = 0;
    int sampleRate_ = 44100;
    SampleRange view_;
    MelRange fullMel_;
    MelRange melView_;
    float verticalScale_ = 1.0f;
    juce::int64 cursor_ = 0;
};

} // namespace SessionScope::state
