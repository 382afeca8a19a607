#include "TestSignals.h"
#include "dsp/spectrogram/MelSpectrogram.h"
#include <algorithm>

using namespace SessionScope;
using dsp::MelSpectrogramEngine;
using dsp::WindowFunction;

TEST_CASE ("Mel scale round trip", "[mel]")
{
    for (float hz : { 20.0f, 100.0f, 440.0f, 1000.0f, 8000.0f, 22050.0f })
        CHECK (MelSpectrogramEngine::melToHz (MelSpectrogramEngine::hzToMel (hz)) == Approx (hz).epsilon (1.0e-4));

    CHECK (MelSpectrogramEngine::hzToMel (0.0f) == Approx (0.0f));
    CHECK (MelSpectrogramEngine::hzToMel (700.0f) == Approx (2595.0f * std::log10 (2.0f)));
}

TEST_CASE ("Frame count covers every sample", "[mel][stft]")
{
    CHECK (MelSpectrogramEngine::getNumFrames (2047, 2048, 512) == 0);
    CHECK (MelSpectrogramEngine::getNumFrames (2048, 2048, 512) == 1);
    CHECK (MelSpectrogramEngine::getNumFrames (2049, 2048, 512) == 2);
    CHECK (MelSpectrogramEngine::getNumFrames (2560, 2048, 512) == 2);
    CHECK (MelSpectrogramEngine::getNumFrames (2561, 2048, 512) == 3);
}

TEST_CASE ("Window functions are periodic", "[mel][window]")
{
    const auto hann = MelSpectrogramEngine::createWindow (WindowFunction::hann, 4);
    REQUIRE (hann.size() == 4);
    CHECK (hann[0] == Approx (0.0f).margin (1.0e-7));
    CHECK (hann[1] == Approx (0.5f));
    CHECK (hann[2] == Approx (1.0f));
    CHECK (hann[3] == Approx (0.5f));

    const auto hamming = MelSpectrogramEngine::createWindow (WindowFunction::hamming, 8);
    CHECK (hamming[0] == Approx (0.08f));
    CHECK (hamming[4] == Approx (1.0f));

    const auto bh = MelSpectrogramEngine::createWindow (WindowFunction::blackmanHarris, 8);
    CHECK (bh[0] == Approx (6.0e-5f).margin (1.0e-6));
    CHECK (bh[4] == Approx (1.0f).margin (1.0e-5));
}

TEST_CASE ("Window function names", "[mel][window]")
{
    for (auto w : { WindowFunction::hann, WindowFunction::hamming, WindowFunction::blackmanHarris })
    {
        WindowFunction parsed = WindowFunction::hann;
        REQUIRE (dsp::windowFunctionFromString (dsp::toString (w), parsed));
        CHECK (parsed == w);
    }

    WindowFunction untouched = WindowFunction::hamming;
    CHECK_FALSE (dsp::windowFunctionFromString ("kaiser", untouched));
    CHECK (untouched == WindowFunction::hamming);
}

TEST_CASE ("Mel filterbank shape", "[mel][filterbank]")
{
    const int fftSize = 2048;
    const auto filters = MelSpectrogramEngine::createFilterbank (256, fftSize, 44100, 20.0f, 22050.0f);

    REQUIRE (filters.size() == 256);

    int previousFirst = 0;
    int unitPeaks = 0;

    for (const auto& f : filters)
    {
        CHECK (f.firstBin >= previousFirst);
        CHECK (f.firstBin + static_cast<int> (f.weights.size()) <= fftSize / 2 + 1);
        previousFirst = f.firstBin;

        for (auto w : f.weights)
        {
            CHECK (w >= 0.0f);
            CHECK (w <= 1.0f);
        }

        if (! f.weights.empty() && *std::max_element (f.weights.begin(), f.weights.end()) == 1.0f)
            ++unitPeaks;
    }

    CHECK (unitPeaks > 200);
}

TEST_CASE ("Silent stereo file gives a floor-level spectrogram", "[mel][scenario]")
{
    const std::vector<float> silence (44100 * 5, 0.0f);
    auto buffer = test::makeBuffer ({ silence, silence }, 44100);

    const auto spec = MelSpectrogramEngine::compute (*buffer, {});

    REQUIRE (spec != nullptr);
    CHECK (spec->numMels == 256);
    CHECK (spec->numFrames == 428);
    CHECK (spec->db.size() == static_cast<std::size_t> (256 * 428));
    CHECK (spec->getDb (0, 0) == Approx (-100.0f));
    CHECK (spec->getDb (255, 427) == Approx (-100.0f));
}

TEST_CASE ("Audio shorter than one frame has no spectrogram", "[mel][scenario]")
{
    dsp::FftParams params;
    params.fftSize = 2048;

    auto shortBuffer = test::makeBuffer ({ test::sine (2047, 440.0, 44100.0) }, 44100);
    CHECK (MelSpectrogramEngine::compute (*shortBuffer, params) == nullptr);

    auto exactBuffer = test::makeBuffer ({ test::sine (2048, 440.0, 44100.0) }, 44100);
    const auto spec = MelSpectrogramEngine::compute (*exactBuffer, params);
    REQUIRE (spec != nullptr);
    CHECK (spec->numFrames == 1);

    auto empty = test::makeBuffer ({}, 44100);
    CHECK (MelSpectrogramEngine::compute (*empty, params) == nullptr);
}

TEST_CASE ("A pure tone peaks in the matching mel band", "[mel]")
{
    auto buffer = test::makeBuffer ({ test::sine (44100, 1000.0, 44100.0, 0.5f) }, 44100);

    const auto spec = MelSpectrogramEngine::compute (*buffer, {});
    REQUIRE (spec != nullptr);

    const int frame = spec->numFrames / 2;
    int loudest = 0;
    for (int m = 1; m < spec->numMels; ++m)
        if (spec->getDb (m, frame) > spec->getDb (loudest, frame))
            loudest = m;

    const float melMin = MelSpectrogramEngine::hzToMel (20.0f);
    const float melMax = MelSpectrogramEngine::hzToMel (22050.0f);
    const float centreMel = melMin + (melMax - melMin) * static_cast<float> (loudest + 1) / 257.0f;

    CHECK (MelSpectrogramEngine::melToHz (centreMel) == Approx (1000.0f).margin (80.0f));
    CHECK (spec->getDb (loudest, frame) > -30.0f);
}

TEST_CASE ("Mel spectrogram stops when cancelled", "[mel][cancel]")
{
    auto buffer = test::makeBuffer ({ test::noise (44100, 21) }, 44100);

    int polls = 0;
    const auto spec = MelSpectrogramEngine::compute (*buffer, {}, {}, [&polls] { return ++polls > 1; });

    CHECK (spec == nullptr);
    CHECK (polls >= 2);
}
