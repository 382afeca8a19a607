/*
  ==============================================================================

    SpectrogramImageCache.h
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#pragma once

#include "../../dsp/spectrogram/MelSpectrogram.h"
#include <juce_graphics/juce_graphics.h>

namespace SessionScope::ui
{

/** Everything that determines the raster. Identical keys reuse the image. */
struct SpectrogramImageKey
{
    const dsp::MelSpectrogram* spectrogram = nullptr;
    juce::int64 totalSamples = 0;
    juce::Range<juce::int64> view;
    juce::Range<float> melView;
    int width = 0;
    int height = 0;
    juce::String colormap;
    float dbFloor = 0.0f;
    float dbCeil = 0.0f;

    bool operator== (const SpectrogramImageKey& other) const noexcept
    {
        return spectrogram == other.spectrogram
            && totalSamples == other.totalSamples
            && view == other.view
            && melView == other.melView
            && width == other.width
            && height == other.height
            && colormap == other.colormap
            && dbFloor == other.dbFloor
            && dbCeil == other.dbCeil;
    }

    bool operator!= (const SpectrogramImageKey& other) const noexcept { return ! (*this == other); }
};

//==============================================================================
/**
    Renders the visible slice of a mel spectrogram into a colour-mapped image
    of exactly width x height pixels, low frequencies at the bottom.

    Only the last image is kept. Interactive thread only.
*/
class SpectrogramImageCache
{
public:
    SpectrogramImageCache() = default;

    /** Returns a null image when there is no spectrogram, the size is empty or
        the colormap is unknown.
    */
    juce::Image getImage (const dsp::MelSpectrogramPtr& spectrogram,
                          juce::int64 totalSamples,
                          juce::Range<juce::int64> view,
                          juce::Range<float> melView,
                          int width,
                          int height,
                          const juce::String& colormap,
                          float dbFloor,
                          float dbCeil);

    void invalidate();

    /** True if the most recent getImage() call had to render. */
    bool wasRebuilt() const noexcept { return rebuilt_; }

    /** Frame span [start, end) of the spectrogram shown for a sample view. */
    static juce::Range<int> framesForView (int numFrames, juce::int64 totalSamples, juce::Range<juce::int64> view) noexcept;

    /** Mel row span [lo, hi) shown for a mel view inside the full mel range. */
    static juce::Range<int> rowsForMelView (int numMels, juce::Range<float> fullMelRange, juce::Range<float> melView) noexcept;

private:
    juce::Image render (const dsp::MelSpectrogram& spectrogram, const SpectrogramImageKey& key) const;

    SpectrogramImageKey key_;
    juce::Image image_;
    dsp::MelSpectrogramPtr source_;   // keeps the keyed pointer alive
    bool rebuilt_ = false;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (SpectrogramImageCache)
};

} // namespace SessionScope::ui
