#pragma once

#include "../../audio/SampleBuffer.h"
#include "../Cancellation.h"
#include <memory>
#include <vector>

namespace SessionScope::dsp
{

enum class WindowFunction
{
    hann,
    hamming,
    blackmanHarris
};

/** Stable lowercase names: "hann", "hamming", "blackmanharris". */
juce::String toString (WindowFunction w);

/** Returns false (and leaves result untouched) for unknown names. */
bool windowFunctionFromString (const juce::String& name, WindowFunction& result);

struct FftParams
{
    static constexpr int kMinFftSize = 512;
    static constexpr int kMaxFftSize = 8192;

    int fftSize = 2048;
    WindowFunction window = WindowFunction::hann;

    int getHopSize() const noexcept { return fftSize / 4; }

    bool operator== (const FftParams& other) const noexcept
    {
        return fftSize == other.fftSize && window == other.window;
    }

    bool operator!= (const FftParams& other) const noexcept { return ! (*this == other); }
};

struct MelOptions
{
    int numMels = 256;
    float minFrequencyHz = 20.0f;
    float maxFrequencyHz = 22050.0f;   // capped at Nyquist

    bool operator== (const MelOptions& other) const noexcept
    {
        return numMels == other.numMels
            && minFrequencyHz == other.minFrequencyHz
            && maxFrequencyHz == other.maxFrequencyHz;
    }

    bool operator!= (const MelOptions& other) const noexcept { return ! (*this == other); }
};

/** Triangular filter: weights[j] applies to FFT bin firstBin + j. */
struct MelFilter
{
    int firstBin = 0;
    std::vector<float> weights;
};

//==============================================================================
/**
    Full-file mel spectrogram in dB, row-major: numMels rows x numFrames columns.
    Row 0 is the lowest mel band.
*/
struct MelSpectrogram
{
    FftParams params;
    int sampleRate = 0;
    int numMels = 0;
    int numFrames = 0;
    float minFrequencyHz = 0.0f;
    float maxFrequencyHz = 0.0f;
    std::vector<float> db;

    float getDb (int mel, int frame) const noexcept
    {
        return db[static_cast<std::size_t> (mel) * static_cast<std::size_t> (numFrames)
                  + static_cast<std::size_t> (frame)];
    }

    const float* getRow (int mel) const noexcept
    {
        return db.data() + static_cast<std::size_t> (mel) * static_cast<std::size_t> (numFrames);
    }
};

using MelSpectrogramPtr = std::shared_ptr<const MelSpectrogram>;

//==============================================================================
/**
    Offline STFT + mel filterbank.

    Frames are fftSize long with a hop of fftSize/4. The final partial frame
    is zero padded so every sample lands in a frame, and each spectrum is
    scaled by 1/sum(window).
*/
class MelSpectrogramEngine
{
public:
    static constexpr float kPowerEpsilon = 1.0e-10f;

    /** Returns nullptr when the audio is shorter than one frame, has no
        channels, or the computation was cancelled.
    */
    static MelSpectrogramPtr compute (const SampleBuffer& buffer,
                                      const FftParams& params,
                                      const MelOptions& options = {},
                                      const ShouldCancel& shouldCancel = {});

    static float hzToMel (float hz) noexcept;
    static float melToHz (float mel) noexcept;

    /** Periodic window of the given length. */
    static std::vector<float> createWindow (WindowFunction w, int size);

    static std::vector<MelFilter> createFilterbank (int numMels, int fftSize, int sampleRate,
                                                    float minHz, float maxHz);

    /** 1 + ceil((n - fftSize) / hop), or 0 when n < fftSize. */
    static int getNumFrames (juce::int64 numSamples, int fftSize, int hopSize) noexcept;

    static bool isValidFftSize (int fftSize) noexcept;

private:
    MelSpectrogramEngine() = delete;
};

} // namespace SessionScope::dsp
