#pragma once

#include "../dsp/spectrogram/MelSpectrogram.h"
#include <juce_data_structures/juce_data_structures.h>

namespace SessionScope::config
{

//==============================================================================
/**
    User-tunable analysis and display settings.

    Values are plain fields; validated() returns a copy with every field snapped
    or clamped into its legal range. ValueTree round-tripping uses the stable
    keys from the setting-spec table so hosts can persist the tree however they
    like.
*/
struct EngineSettings
{
    static constexpr int kDefaultRmsWindowMs = 400;
    static constexpr int kMinNumMels = 16;
    static constexpr int kMaxNumMels = 512;

    int rmsWindowMs = kDefaultRmsWindowMs;
    int fftSize = 2048;
    dsp::WindowFunction windowFunction = dsp::WindowFunction::hann;
    juce::String colormap { "magma" };
    float dbFloor = -80.0f;
    float dbCeil = 0.0f;
    int numMels = 256;
    float minFrequencyHz = 20.0f;
    float maxFrequencyHz = 22050.0f;

    EngineSettings validated() const;

    /** max(1, int(ms / 1000 * sampleRate)) */
    int getRmsWindowSamples (int sampleRate) const noexcept;

    dsp::FftParams getFftParams() const noexcept;
    dsp::MelOptions getMelOptions() const noexcept;

    juce::ValueTree toValueTree() const;

    /** Missing or malformed properties keep their defaults. Result is validated. */
    static EngineSettings fromValueTree (const juce::ValueTree& tree);

    /** Nearest power of two inside [512, 8192]. */
    static int snapFftSize (int requested) noexcept;

    static const juce::Identifier treeType;

    bool operator== (const EngineSettings& other) const noexcept;
    bool operator!= (const EngineSettings& other) const noexcept { return ! (*this == other); }
};

} // namespace SessionScope::config
