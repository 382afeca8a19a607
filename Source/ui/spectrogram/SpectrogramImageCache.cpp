/*
  ==============================================================================

    SpectrogramImageCache.cpp
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#include "SpectrogramImageCache.h"
#include "ColormapTable.h"
#include "../../config/DevFlags.h"
#include <cmath>

namespace SessionScope::ui
{

juce::Range<int> SpectrogramImageCache::framesForView (int numFrames,
                                                       juce::int64 totalSamples,
                                                       juce::Range<juce::int64> view) noexcept
{
    if (numFrames <= 0 || totalSamples <= 0)
        return {};

    auto start = static_cast<int> (view.getStart() * numFrames / totalSamples);
    auto end = static_cast<int> (view.getEnd() * numFrames / totalSamples);

    start = juce::jlimit (0, numFrames - 1, start);
    end = juce::jlimit (start + 1, numFrames, end);

    return { start, end };
}

juce::Range<int> SpectrogramImageCache::rowsForMelView (int numMels,
                                                        juce::Range<float> fullMelRange,
                                                        juce::Range<float> melView) noexcept
{
    if (numMels <= 0)
        return {};

    const float fullLength = fullMelRange.getLength();
    if (fullLength <= 0.0f)
        return { 0, numMels };

    const float scale = static_cast<float> (numMels - 1) / fullLength;
    const float lo = (melView.getStart() - fullMelRange.getStart()) * scale;
    const float hi = (melView.getEnd() - fullMelRange.getStart()) * scale;

    const int rowLo = juce::jlimit (0, numMels - 1, static_cast<int> (lo));
    const int rowHi = juce::jmax (rowLo + 1, juce::jmin (static_cast<int> (std::ceil (hi)) + 1, numMels));

    return { rowLo, rowHi };
}

//==============================================================================
juce::Image SpectrogramImageCache::getImage (const dsp::MelSpectrogramPtr& spectrogram,
                                             juce::int64 totalSamples,
                                             juce::Range<juce::int64> view,
                                             juce::Range<float> melView,
                                             int width,
                                             int height,
                                             const juce::String& colormap,
                                             float dbFloor,
                                             float dbCeil)
{
    rebuilt_ = false;

    if (spectrogram == nullptr || spectrogram->numFrames <= 0 || width <= 0 || height <= 0 || totalSamples <= 0)
        return {};

    SpectrogramImageKey key;
    key.spectrogram = spectrogram.get();
    key.totalSamples = totalSamples;
    key.view = view;
    key.melView = melView;
    key.width = width;
    key.height = height;
    key.colormap = colormap;
    key.dbFloor = dbFloor;
    key.dbCeil = dbCeil;

    if (image_.isValid() && key == key_)
        return image_;

    auto rendered = render (*spectrogram, key);
    if (! rendered.isValid())
        return {};

    key_ = key;
    image_ = rendered;
    source_ = spectrogram;
    rebuilt_ = true;

    SESSIONSCOPE_TRACE ("SpectrogramImageCache rebuild " + juce::String (width) + "x" + juce::String (height));

    return image_;
}

void SpectrogramImageCache::invalidate()
{
    key_ = {};
    image_ = {};
    source_.reset();
    rebuilt_ = false;
}

juce::Image SpectrogramImageCache::render (const dsp::MelSpectrogram& spectrogram, const SpectrogramImageKey& key) const
{
    const auto* table = ColormapTable::lut (key.colormap);
    if (table == nullptr)
    {
        DBG ("SpectrogramImageCache: unknown colormap '" << key.colormap << "'");
        return {};
    }

    const juce::Range<float> fullMelRange (dsp::MelSpectrogramEngine::hzToMel (spectrogram.minFrequencyHz),
                                           dsp::MelSpectrogramEngine::hzToMel (spectrogram.maxFrequencyHz));

    const auto frames = framesForView (spectrogram.numFrames, key.totalSamples, key.view);
    const auto rows = rowsForMelView (spectrogram.numMels, fullMelRange, key.melView);

    const int numCols = frames.getLength();
    const int numRows = rows.getLength();

    if (numCols <= 0 || numRows <= 0)
        return {};

    const float range = juce::jmax (key.dbCeil - key.dbFloor, 1.0f);

    juce::Image raster (juce::Image::ARGB, numCols, numRows, false);

    {
        juce::Image::BitmapData bitmap (raster, juce::Image::BitmapData::writeOnly);

        for (int r = 0; r < numRows; ++r)
        {
            // Top image row is the highest mel band
            const float* rowData = spectrogram.getRow (rows.getEnd() - 1 - r);

            for (int c = 0; c < numCols; ++c)
            {
                const float v = rowData[frames.getStart() + c];
                const float norm = juce::jlimit (0.0f, 1.0f, (v - key.dbFloor) / range);
                bitmap.setPixelColour (c, r, ColormapTable::colourAt (*table, ColormapTable::indexFor (norm)));
            }
        }
    }

    if (numCols == key.width && numRows == key.height)
        return raster;

    return raster.rescaled (key.width, key.height, juce::Graphics::highResamplingQuality);
}

} // namespace SessionScope::ui
