#include <catch2/catch.hpp>

#include "config/EngineSettings.h"
#include "control/SettingSpecs.h"
#include <limits>

using namespace SessionScope;
using config::EngineSettings;

TEST_CASE ("EngineSettings defaults", "[settings]")
{
    const EngineSettings s;

    CHECK (s.rmsWindowMs == 400);
    CHECK (s.fftSize == 2048);
    CHECK (s.windowFunction == dsp::WindowFunction::hann);
    CHECK (s.colormap == "magma");
    CHECK (s.dbFloor == -80.0f);
    CHECK (s.dbCeil == 0.0f);
    CHECK (s.numMels == 256);
    CHECK (s.minFrequencyHz == 20.0f);
    CHECK (s.maxFrequencyHz == 22050.0f);
    CHECK (s.validated() == s);
}

TEST_CASE ("EngineSettings FFT size snaps to a supported power of two", "[settings]")
{
    CHECK (EngineSettings::snapFftSize (2048) == 2048);
    CHECK (EngineSettings::snapFftSize (3000) == 2048);
    CHECK (EngineSettings::snapFftSize (3100) == 4096);
    CHECK (EngineSettings::snapFftSize (100) == 512);
    CHECK (EngineSettings::snapFftSize (100000) == 8192);
    CHECK (EngineSettings::snapFftSize (-1) == 512);
}

TEST_CASE ("EngineSettings validation clamps every field", "[settings]")
{
    EngineSettings s;
    s.rmsWindowMs = 0;
    s.fftSize = 1000;
    s.colormap = "jet";
    s.dbFloor = std::numeric_limits<float>::quiet_NaN();
    s.dbCeil = std::numeric_limits<float>::infinity();
    s.numMels = 4;
    s.minFrequencyHz = 5000.0f;
    s.maxFrequencyHz = 100.0f;

    const auto v = s.validated();

    CHECK (v.rmsWindowMs == 1);
    CHECK (v.fftSize == 1024);
    CHECK (v.colormap == "magma");
    CHECK (v.dbFloor == -80.0f);
    CHECK (v.dbCeil == 0.0f);
    CHECK (v.numMels == EngineSettings::kMinNumMels);
    CHECK (v.minFrequencyHz == 20.0f);
    CHECK (v.maxFrequencyHz == 22050.0f);
}

TEST_CASE ("EngineSettings RMS window in samples", "[settings]")
{
    EngineSettings s;
    CHECK (s.getRmsWindowSamples (48000) == 19200);
    CHECK (s.getRmsWindowSamples (44100) == 17640);

    s.rmsWindowMs = 1;
    CHECK (s.getRmsWindowSamples (500) == 1);
}

TEST_CASE ("EngineSettings ValueTree round trip", "[settings][state]")
{
    EngineSettings s;
    s.rmsWindowMs = 250;
    s.fftSize = 4096;
    s.windowFunction = dsp::WindowFunction::blackmanHarris;
    s.colormap = "viridis";
    s.dbFloor = -96.0f;
    s.dbCeil = -6.0f;
    s.numMels = 128;
    s.minFrequencyHz = 40.0f;
    s.maxFrequencyHz = 16000.0f;

    const auto tree = s.toValueTree();

    CHECK (tree.hasType (EngineSettings::treeType));
    CHECK (tree.getProperty ("spectrogram.window").toString() == "blackmanharris");
    CHECK (static_cast<int> (tree.getProperty ("spectrogram.fftSize")) == 4096);

    CHECK (EngineSettings::fromValueTree (tree) == s);
}

TEST_CASE ("EngineSettings from a partial or malformed tree", "[settings][state]")
{
    juce::ValueTree tree (EngineSettings::treeType);
    tree.setProperty ("spectrogram.fftSize", 5000, nullptr);
    tree.setProperty ("spectrogram.window", "kaiser", nullptr);
    tree.setProperty ("spectrogram.colormap", "grayscale", nullptr);

    const auto s = EngineSettings::fromValueTree (tree);

    CHECK (s.fftSize == 4096);
    CHECK (s.windowFunction == dsp::WindowFunction::hann);
    CHECK (s.colormap == "grayscale");
    CHECK (s.rmsWindowMs == EngineSettings::kDefaultRmsWindowMs);

    CHECK (EngineSettings::fromValueTree (juce::ValueTree()) == EngineSettings());
}
