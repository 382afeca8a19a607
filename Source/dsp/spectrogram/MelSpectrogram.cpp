#include "MelSpectrogram.h"
#include "../../config/DevFlags.h"
#include <juce_dsp/juce_dsp.h>
#include <algorithm>
#include <cmath>

namespace SessionScope::dsp
{

namespace
{
    // Frames between cancellation polls
    constexpr int kFramesPerBlock = 64;
}

juce::String toString (WindowFunction w)
{
    switch (w)
    {
        case WindowFunction::hann:           return "hann";
        case WindowFunction::hamming:        return "hamming";
        case WindowFunction::blackmanHarris: return "blackmanharris";
    }

    jassertfalse;
    return "hann";
}

bool windowFunctionFromString (const juce::String& name, WindowFunction& result)
{
    const auto lower = name.trim().toLowerCase();

    if (lower == "hann")            { result = WindowFunction::hann;           return true; }
    if (lower == "hamming")         { result = WindowFunction::hamming;        return true; }
    if (lower == "blackmanharris")  { result = WindowFunction::blackmanHarris; return true; }

    return false;
}

//==============================================================================
float MelSpectrogramEngine::hzToMel (float hz) noexcept
{
    return 2595.0f * std::log10 (1.0f + hz / 700.0f);
}

float MelSpectrogramEngine::melToHz (float mel) noexcept
{
    return 700.0f * (std::pow (10.0f, mel / 2595.0f) - 1.0f);
}

bool MelSpectrogramEngine::isValidFftSize (int fftSize) noexcept
{
    return fftSize >= FftParams::kMinFftSize
        && fftSize <= FftParams::kMaxFftSize
        && juce::isPowerOfTwo (fftSize);
}

int MelSpectrogramEngine::getNumFrames (juce::int64 numSamples, int fftSize, int hopSize) noexcept
{
    if (fftSize <= 0 || hopSize <= 0 || numSamples < fftSize)
        return 0;

    const juce::int64 extra = numSamples - fftSize;
    return static_cast<int> (1 + (extra + hopSize - 1) / hopSize);
}

std::vector<float> MelSpectrogramEngine::createWindow (WindowFunction w, int size)
{
    std::vector<float> window (static_cast<std::size_t> (juce::jmax (0, size)), 1.0f);
    const double twoPi = juce::MathConstants<double>::twoPi;

    // Periodic (DFT-even) form: denominator is size, not size - 1
    for (int i = 0; i < size; ++i)
    {
        const double x = twoPi * static_cast<double> (i) / static_cast<double> (size);
        double value = 1.0;

        switch (w)
        {
            case WindowFunction::hann:
                value = 0.5 - 0.5 * std::cos (x);
                break;
            case WindowFunction::hamming:
                value = 0.54 - 0.46 * std::cos (x);
                break;
            case WindowFunction::blackmanHarris:
                value = 0.35875 - 0.48829 * std::cos (x) + 0.14128 * std::cos (2.0 * x) - 0.01168 * std::cos (3.0 * x);
                break;
        }

        window[static_cast<std::size_t> (i)] = static_cast<float> (value);
    }

    return window;
}

std::vector<MelFilter> MelSpectrogramEngine::createFilterbank (int numMels, int fftSize, int sampleRate,
                                                               float minHz, float maxHz)
{
    jassert (numMels > 0 && fftSize > 0 && sampleRate > 0);

    const float nyquist = static_cast<float> (sampleRate) * 0.5f;
    const float topHz = juce::jmin (maxHz, nyquist);
    const int numFreqs = fftSize / 2 + 1;

    const double melMin = hzToMel (minHz);
    const double melMax = hzToMel (topHz);

    // numMels + 2 edge points evenly spaced in mel, mapped to FFT bins
    std::vector<int> bins (static_cast<std::size_t> (numMels + 2), 0);
    for (int i = 0; i < numMels + 2; ++i)
    {
        const double mel = melMin + (melMax - melMin) * static_cast<double> (i) / static_cast<double> (numMels + 1);
        const double hz = 700.0 * (std::pow (10.0, mel / 2595.0) - 1.0);
        bins[static_cast<std::size_t> (i)] = static_cast<int> (std::floor ((fftSize + 1) * hz / sampleRate));
    }

    std::vector<MelFilter> filters (static_cast<std::size_t> (numMels));

    for (int m = 0; m < numMels; ++m)
    {
        const int left = bins[static_cast<std::size_t> (m)];
        int center = bins[static_cast<std::size_t> (m + 1)];
        int right = bins[static_cast<std::size_t> (m + 2)];

        // Degenerate edges are widened by one bin
        if (center == left)
            center = left + 1;
        if (right == center)
            right = center + 1;

        const int first = juce::jmax (0, left);
        const int last = juce::jmin (numFreqs, juce::jmax (center, right));

        auto& filter = filters[static_cast<std::size_t> (m)];
        filter.firstBin = first;

        if (last <= first)
            continue;

        filter.weights.assign (static_cast<std::size_t> (last - first), 0.0f);

        for (int j = first; j < last; ++j)
        {
            float w = 0.0f;

            if (j < center)
                w = static_cast<float> (j - left) / static_cast<float> (center - left);
            else if (j < right)
                w = static_cast<float> (right - j) / static_cast<float> (right - center);

            filter.weights[static_cast<std::size_t> (j - first)] = w;
        }
    }

    return filters;
}

//==============================================================================
MelSpectrogramPtr MelSpectrogramEngine::compute (const SampleBuffer& buffer,
                                                 const FftParams& params,
                                                 const MelOptions& options,
                                                 const ShouldCancel& shouldCancel)
{
    if (! isValidFftSize (params.fftSize))
    {
        jassertfalse;
        return nullptr;
    }

    const int numChannels = buffer.getNumChannels();
    const juce::int64 numSamples = buffer.getNumSamples();
    const int fftSize = params.fftSize;
    const int hopSize = params.getHopSize();

    if (numChannels == 0 || numSamples < fftSize)
    {
        DBG ("MelSpectrogramEngine: audio shorter than one frame, spectrogram unavailable");
        return nullptr;
    }

    // Mono mix (mean of channels) in double precision
    std::vector<double> mono (static_cast<std::size_t> (numSamples), 0.0);
    for (int ch = 0; ch < numChannels; ++ch)
    {
        const float* data = buffer.getReadPointer (ch);
        for (juce::int64 i = 0; i < numSamples; ++i)
            mono[static_cast<std::size_t> (i)] += static_cast<double> (data[i]);
    }

    if (numChannels > 1)
    {
        const double scale = 1.0 / static_cast<double> (numChannels);
        for (auto& s : mono)
            s *= scale;
    }

    if (isCancelled (shouldCancel))
        return nullptr;

    const int numFrames = getNumFrames (numSamples, fftSize, hopSize);
    const int numBins = fftSize / 2 + 1;
    const int numMels = options.numMels;

    const auto window = createWindow (params.window, fftSize);
    const auto filters = createFilterbank (numMels, fftSize, buffer.getSampleRate(),
                                           options.minFrequencyHz, options.maxFrequencyHz);

    double windowSum = 0.0;
    for (auto w : window)
        windowSum += static_cast<double> (w);

    // Amplitude-spectrum scaling, squared for power
    const double powerScale = windowSum > 0.0 ? 1.0 / (windowSum * windowSum) : 1.0;

    juce::dsp::FFT fft (static_cast<int> (std::log2 (fftSize)));
    std::vector<float> fftBuffer (static_cast<std::size_t> (fftSize) * 2, 0.0f);
    std::vector<double> power (static_cast<std::size_t> (numBins), 0.0);

    auto result = std::make_shared<MelSpectrogram>();
    result->params = params;
    result->sampleRate = buffer.getSampleRate();
    result->numMels = numMels;
    result->numFrames = numFrames;
    result->minFrequencyHz = options.minFrequencyHz;
    result->maxFrequencyHz = juce::jmin (options.maxFrequencyHz, static_cast<float> (buffer.getSampleRate()) * 0.5f);
    result->db.assign (static_cast<std::size_t> (numMels) * static_cast<std::size_t> (numFrames), 0.0f);

    for (int frame = 0; frame < numFrames; ++frame)
    {
        if (frame % kFramesPerBlock == 0 && isCancelled (shouldCancel))
        {
            DBG ("MelSpectrogramEngine: cancelled at frame " << frame << " of " << numFrames);
            return nullptr;
        }

        const juce::int64 start = static_cast<juce::int64> (frame) * hopSize;

        // Window the frame; samples past the end are zero padding
        std::fill (fftBuffer.begin(), fftBuffer.end(), 0.0f);
        for (int i = 0; i < fftSize; ++i)
        {
            const juce::int64 idx = start + i;
            if (idx >= numSamples)
                break;

            const std::size_t iSz = static_cast<std::size_t> (i);
            fftBuffer[iSz] = static_cast<float> (mono[static_cast<std::size_t> (idx)]) * window[iSz];
        }

        // Output is interleaved (re, im) for bins 0..fftSize/2
        fft.performRealOnlyForwardTransform (fftBuffer.data(), true);

        for (int k = 0; k < numBins; ++k)
        {
            const double re = static_cast<double> (fftBuffer[static_cast<std::size_t> (2 * k)]);
            const double im = static_cast<double> (fftBuffer[static_cast<std::size_t> (2 * k + 1)]);
            power[static_cast<std::size_t> (k)] = (re * re + im * im) * powerScale;
        }

        for (int m = 0; m < numMels; ++m)
        {
            const auto& filter = filters[static_cast<std::size_t> (m)];
            double melPower = 0.0;

            for (std::size_t j = 0; j < filter.weights.size(); ++j)
                melPower += static_cast<double> (filter.weights[j]) * power[static_cast<std::size_t> (filter.firstBin) + j];

            const double clamped = juce::jmax (melPower, static_cast<double> (kPowerEpsilon));
            result->db[static_cast<std::size_t> (m) * static_cast<std::size_t> (numFrames) + static_cast<std::size_t> (frame)]
                = static_cast<float> (10.0 * std::log10 (clamped));
        }
    }

    SESSIONSCOPE_LOG ("MelSpectrogramEngine: " + juce::String (numMels) + " mels x "
                      + juce::String (numFrames) + " frames, fft " + juce::String (fftSize)
                      + " " + toString (params.window));

    return result;
}

} // namespace SessionScope::dsp
