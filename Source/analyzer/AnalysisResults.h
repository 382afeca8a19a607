#pragma once

#include "../dsp/rms/RmsEngine.h"
#include "../dsp/spectrogram/MelSpectrogram.h"
#include <cstdint>
#include <memory>
#include <optional>

namespace SessionScope
{

//==============================================================================
/**
    Result of a full-load task, handed from the worker to the interactive thread.
    Immutable once published; every heavy member is shared, never copied.
*/
struct LoadResult
{
    // Load generation the task was launched for (stale if it no longer matches)
    uint32_t generation = 0;

    SampleBuffer::Ptr buffer;

    std::optional<dsp::PeakMarker> peak;

    int rmsWindow = 0;   // window the RMS-max marker was computed for
    std::shared_ptr<const dsp::CumulativeSums> cumulativeSums;
    std::optional<dsp::RmsMaxMarker> rmsMax;

    dsp::FftParams fftParams;
    dsp::MelOptions melOptions;
    dsp::MelSpectrogramPtr spectrogram;   // nullptr = unavailable
};

//==============================================================================
/**
    Result of a spectrogram recompute after an FFT parameter change.
*/
struct SpectrogramResult
{
    uint32_t generation = 0;
    dsp::FftParams fftParams;
    dsp::MelOptions melOptions;
    dsp::MelSpectrogramPtr spectrogram;   // nullptr = unavailable
};

} // namespace SessionScope
