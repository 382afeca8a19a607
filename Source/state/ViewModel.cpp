/*
  ==============================================================================

    ViewModel.cpp
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#include "ViewModel.h"
#include "../dsp/spectrogram/MelSpectrogram.h"

namespace SessionScope::state
{

using dsp::MelSpectrogramEngine;

void ViewModel::reset (juce::int64 totalSamples, int sampleRate, float minFrequencyHz, float maxFrequencyHz)
{
    totalSamples_ = juce::jmax<juce::int64> (0, totalSamples);
    sampleRate_ = sampleRate;
    view_ = { 0, totalSamples_ };
    cursor_ = 0;
    verticalScale_ = 1.0f;

    fullMel_ = melRangeFor (minFrequencyHz, maxFrequencyHz);
    melView_ = fullMel_;
}

ViewModel::MelRange ViewModel::melRangeFor (float minFrequencyHz, float maxFrequencyHz) const noexcept
{
    const float topHz = juce::jmin (maxFrequencyHz, static_cast<float> (sampleRate_) * 0.5f);
    return { MelSpectrogramEngine::hzToMel (minFrequencyHz), MelSpectrogramEngine::hzToMel (topHz) };
}

void ViewModel::setFrequencyLimits (float minFrequencyHz, float maxFrequencyHz)
{
    fullMel_ = melRangeFor (minFrequencyHz, maxFrequencyHz);

    const float span = juce::jmin (melView_.getLength(), fullMel_.getLength());
    if (span <= 0.0f)
    {
        melView_ = fullMel_;
        return;
    }

    // Keep the zoom level, slide the window back inside the new limits
    applyMelView (melView_.getStart(), melView_.getStart() + span, span);
}

//==============================================================================
bool ViewModel::applyView (juce::int64 start, juce::int64 length)
{
    length = juce::jlimit<juce::int64> (0, totalSamples_, length);
    start = juce::jlimit<juce::int64> (0, totalSamples_ - length, start);

    const SampleRange newView (start, start + length);
    if (newView == view_)
        return false;

    view_ = newView;
    return true;
}

bool ViewModel::zoomIn()
{
    const auto viewLen = view_.getLength();
    if (viewLen <= kMinViewLength)
        return false;

    const auto centre = view_.clipValue (cursor_);
    const auto newLen = juce::jmax (viewLen / 2, kMinViewLength);
    return applyView (centre - newLen / 2, newLen);
}

bool ViewModel::zoomOut()
{
    const auto viewLen = view_.getLength();
    if (viewLen >= totalSamples_)
        return false;

    const auto centre = juce::jlimit (view_.getStart(), view_.getEnd(), cursor_);
    const auto newLen = juce::jmin (viewLen * 2, totalSamples_);
    return applyView (centre - newLen / 2, newLen);
}

bool ViewModel::zoomAt (float anchorFraction, bool zoomIn)
{
    if (totalSamples_ <= 0)
        return false;

    const auto viewLen = view_.getLength();
    const double frac = juce::jlimit (0.0, 1.0, static_cast<double> (anchorFraction));
    const auto anchor = juce::jlimit (view_.getStart(), view_.getEnd(),
                                      view_.getStart() + static_cast<juce::int64> (frac * static_cast<double> (viewLen)));

    const auto newLen = zoomIn ? juce::jmax (viewLen * 2 / 3, kMinViewLength)
                               : juce::jmin (viewLen * 3 / 2, totalSamples_);

    if (newLen == viewLen)
        return false;

    return applyView (anchor - static_cast<juce::int64> (frac * static_cast<double> (newLen)), newLen);
}

bool ViewModel::zoomFit()
{
    verticalScale_ = 1.0f;
    resetFreqView();
    return applyView (0, totalSamples_);
}

bool ViewModel::scroll (juce::int64 deltaSamples)
{
    return applyView (view_.getStart() + deltaSamples, view_.getLength());
}

bool ViewModel::scrollByPage (int direction)
{
    if (direction == 0)
        return false;

    const auto step = juce::jmax<juce::int64> (1, view_.getLength() / kPageDivisor);
    return scroll (direction > 0 ? step : -step);
}

bool ViewModel::setViewRange (SampleRange newView)
{
    newView = newView.getIntersectionWith ({ 0, totalSamples_ });
    if (newView.isEmpty())
        return false;

    return applyView (newView.getStart(), newView.getLength());
}

bool ViewModel::setCursor (juce::int64 sample)
{
    cursor_ = juce::jlimit<juce::int64> (0, totalSamples_, sample);

    if (cursor_ >= view_.getEnd() && view_.getEnd() < totalSamples_)
    {
        // Page forward: the cursor becomes the left edge
        const auto viewLen = view_.getLength();
        const SampleRange paged (cursor_, juce::jmin (cursor_ + viewLen, totalSamples_));
        if (paged != view_ && ! paged.isEmpty())
        {
            view_ = paged;
            return true;
        }
    }

    return false;
}

//==============================================================================
void ViewModel::applyMelView (float newMin, float newMax, float span)
{
    if (newMin < fullMel_.getStart())
    {
        newMin = fullMel_.getStart();
        newMax = newMin + span;
    }

    if (newMax > fullMel_.getEnd())
    {
        newMax = fullMel_.getEnd();
        newMin = newMax - span;
    }

    melView_ = { juce::jmax (newMin, fullMel_.getStart()), juce::jmin (newMax, fullMel_.getEnd()) };
}

void ViewModel::freqZoom (float factor, std::optional<float> anchorMel)
{
    const float span = melView_.getLength();
    float anchor = melView_.getStart() + span * 0.5f;
    float frac = 0.5f;

    if (anchorMel.has_value())
    {
        anchor = melView_.clipValue (*anchorMel);
        frac = span > 0.0f ? (anchor - melView_.getStart()) / span : 0.5f;
    }

    const float newSpan = juce::jmax (juce::jmin (span * factor, fullMel_.getLength()), kMinMelSpan);
    applyMelView (anchor - frac * newSpan, anchor + (1.0f - frac) * newSpan, newSpan);
}

void ViewModel::scrollFreq (float deltaMel)
{
    applyMelView (melView_.getStart() + deltaMel, melView_.getEnd() + deltaMel, melView_.getLength());
}

void ViewModel::resetFreqView()
{
    melView_ = fullMel_;
}

void ViewModel::scaleUp()
{
    setVerticalScale (verticalScale_ * kVerticalScaleStep);
}

void ViewModel::scaleDown()
{
    setVerticalScale (verticalScale_ / kVerticalScaleStep);
}

void ViewModel::setVerticalScale (float scale)
{
    verticalScale_ = juce::jlimit (kMinVerticalScale, kMaxVerticalScale, scale);
}

//==============================================================================
int ViewModel::sampleToPixel (juce::int64 sample, int width) const noexcept
{
    const auto viewLen = view_.getLength();
    if (viewLen <= 0)
        return 0;

    return static_cast<int> (static_cast<double> (sample - view_.getStart()) / static_cast<double> (viewLen) * width);
}

juce::int64 ViewModel::pixelToSample (float x, int width) const noexcept
{
    const auto viewLen = view_.getLength();
    if (width <= 0 || viewLen <= 0)
        return 0;

    const auto offset = static_cast<juce::int64> (static_cast<double> (x) / width * static_cast<double> (viewLen));
    return juce::jlimit<juce::int64> (0, juce::jmax<juce::int64> (0, totalSamples_ - 1), view_.getStart() + offset);
}

float ViewModel::melToPixel (float mel, int height) const noexcept
{
    const float span = melView_.getLength();
    if (height <= 0 || span <= 0.0f)
        return 0.0f;

    const float frac = (mel - melView_.getStart()) / span;
    return (1.0f - frac) * static_cast<float> (height);
}

float ViewModel::pixelToMel (float y, int height) const noexcept
{
    if (height <= 0)
        return melView_.getStart();

    const float frac = juce::jlimit (0.0f, 1.0f, 1.0f - y / static_cast<float> (height));
    return melView_.getStart() + frac * melView_.getLength();
}

float ViewModel::pixelToHz (float y, int height) const noexcept
{
    return MelSpectrogramEngine::melToHz (pixelToMel (y, height));
}

} // namespace SessionScope::state
