#pragma once

namespace SessionScope
{

enum class SettingGroup
{
    Waveform,
    Spectrogram,
    Count
};

enum class SettingId
{
    RmsWindowMs,
    FftSize,
    WindowFunction,   // hann / hamming / blackmanharris
    Colormap,
    DbFloor,
    DbCeil,
    NumMels,
    MinFrequencyHz,
    MaxFrequencyHz,

    Count
};

} // namespace SessionScope
