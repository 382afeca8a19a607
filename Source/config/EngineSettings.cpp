#include "EngineSettings.h"
#include "../control/SettingSpecs.h"
#include "../ui/spectrogram/ColormapTable.h"
#include <cmath>

namespace SessionScope::config
{

const juce::Identifier EngineSettings::treeType ("EngineSettings");

namespace
{
    juce::Identifier keyFor (SettingId id)
    {
        const auto key = toStableKey (id);
        return juce::Identifier (juce::String (key.data(), key.size()));
    }

    float finiteOr (float value, float fallback) noexcept
    {
        return std::isfinite (value) ? value : fallback;
    }
}

//==============================================================================
int EngineSettings::snapFftSize (int requested) noexcept
{
    const int clamped = juce::jlimit (dsp::FftParams::kMinFftSize, dsp::FftParams::kMaxFftSize, requested);
    const int upper = juce::nextPowerOfTwo (clamped);

    if (upper == clamped)
        return clamped;

    const int lower = upper / 2;
    return (clamped - lower) < (upper - clamped) ? lower : upper;
}

EngineSettings EngineSettings::validated() const
{
    const EngineSettings defaults;
    EngineSettings s (*this);

    s.rmsWindowMs = juce::jmax (1, rmsWindowMs);
    s.fftSize = snapFftSize (fftSize);

    if (! ui::ColormapTable::contains (colormap))
        s.colormap = ui::ColormapTable::kDefaultName;

    s.dbFloor = finiteOr (dbFloor, defaults.dbFloor);
    s.dbCeil = finiteOr (dbCeil, defaults.dbCeil);
    s.numMels = juce::jlimit (kMinNumMels, kMaxNumMels, numMels);

    s.minFrequencyHz = finiteOr (minFrequencyHz, defaults.minFrequencyHz);
    s.maxFrequencyHz = finiteOr (maxFrequencyHz, defaults.maxFrequencyHz);

    if (s.minFrequencyHz < 0.0f || s.maxFrequencyHz <= s.minFrequencyHz)
    {
        s.minFrequencyHz = defaults.minFrequencyHz;
        s.maxFrequencyHz = defaults.maxFrequencyHz;
    }

    return s;
}

int EngineSettings::getRmsWindowSamples (int sampleRate) const noexcept
{
    return juce::jmax (1, static_cast<int> (static_cast<double> (rmsWindowMs) / 1000.0 * sampleRate));
}

dsp::FftParams EngineSettings::getFftParams() const noexcept
{
    dsp::FftParams p;
    p.fftSize = fftSize;
    p.window = windowFunction;
    return p;
}

dsp::MelOptions EngineSettings::getMelOptions() const noexcept
{
    dsp::MelOptions o;
    o.numMels = numMels;
    o.minFrequencyHz = minFrequencyHz;
    o.maxFrequencyHz = maxFrequencyHz;
    return o;
}

//==============================================================================
juce::ValueTree EngineSettings::toValueTree() const
{
    juce::ValueTree tree (treeType);

    tree.setProperty (keyFor (SettingId::RmsWindowMs), rmsWindowMs, nullptr);
    tree.setProperty (keyFor (SettingId::FftSize), fftSize, nullptr);
    tree.setProperty (keyFor (SettingId::WindowFunction), dsp::toString (windowFunction), nullptr);
    tree.setProperty (keyFor (SettingId::Colormap), colormap, nullptr);
    tree.setProperty (keyFor (SettingId::DbFloor), dbFloor, nullptr);
    tree.setProperty (keyFor (SettingId::DbCeil), dbCeil, nullptr);
    tree.setProperty (keyFor (SettingId::NumMels), numMels, nullptr);
    tree.setProperty (keyFor (SettingId::MinFrequencyHz), minFrequencyHz, nullptr);
    tree.setProperty (keyFor (SettingId::MaxFrequencyHz), maxFrequencyHz, nullptr);

    return tree;
}

EngineSettings EngineSettings::fromValueTree (const juce::ValueTree& tree)
{
    EngineSettings s;

    if (! tree.isValid())
        return s;

    if (! tree.hasType (treeType))
        DBG ("EngineSettings: unexpected tree type " << tree.getType().toString());

    s.rmsWindowMs = tree.getProperty (keyFor (SettingId::RmsWindowMs), s.rmsWindowMs);
    s.fftSize = tree.getProperty (keyFor (SettingId::FftSize), s.fftSize);
    s.colormap = tree.getProperty (keyFor (SettingId::Colormap), s.colormap).toString();
    s.dbFloor = tree.getProperty (keyFor (SettingId::DbFloor), s.dbFloor);
    s.dbCeil = tree.getProperty (keyFor (SettingId::DbCeil), s.dbCeil);
    s.numMels = tree.getProperty (keyFor (SettingId::NumMels), s.numMels);
    s.minFrequencyHz = tree.getProperty (keyFor (SettingId::MinFrequencyHz), s.minFrequencyHz);
    s.maxFrequencyHz = tree.getProperty (keyFor (SettingId::MaxFrequencyHz), s.maxFrequencyHz);

    const auto windowName = tree.getProperty (keyFor (SettingId::WindowFunction)).toString();
    if (windowName.isNotEmpty() && ! dsp::windowFunctionFromString (windowName, s.windowFunction))
        DBG ("EngineSettings: unknown window '" << windowName << "', using hann");

    return s.validated();
}

bool EngineSettings::operator== (const EngineSettings& other) const noexcept
{
    return rmsWindowMs == other.rmsWindowMs
        && fftSize == other.fftSize
        && windowFunction == other.windowFunction
        && colormap == other.colormap
        && dbFloor == other.dbFloor
        && dbCeil == other.dbCeil
        && numMels == other.numMels
        && minFrequencyHz == other.minFrequencyHz
        && maxFrequencyHz == other.maxFrequencyHz;
}

} // namespace SessionScope::config
