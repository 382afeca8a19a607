/*
  ==============================================================================

    VisualizationEngine.h
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#pragma once

#include "ComputeWorker.h"
#include "../config/EngineSettings.h"
#include "../dsp/peaks/PeakCache.h"
#include "../dsp/rms/RmsEngine.h"
#include "../state/ViewModel.h"
#include "../ui/spectrogram/SpectrogramImageCache.h"

namespace SessionScope
{

enum class SpectrogramState
{
    Unavailable,
    Computing,
    Ready
};

//==============================================================================
/**
    Interactive-thread facade over the visualization pipeline for one track.

    Owns the active SampleBuffer and every cache derived from it. Heavy
    whole-file work runs on the ComputeWorker; the host pulls finished results
    in with handleCompletedTasks() (typically from a UI timer) and then asks for
    peaks, RMS envelopes, markers and spectrogram images for the visible range.
*/
class VisualizationEngine
{
public:
    using SampleRange = juce::Range<juce::int64>;

    explicit VisualizationEngine (const config::EngineSettings& settings = {});
    ~VisualizationEngine();

    //==============================================================================
    /** Activates new audio and launches the background load.
        On failure the previously loaded buffer stays active.
    */
    juce::Result load (const std::vector<std::vector<float>>& channels, int sampleRate);
    juce::Result load (juce::AudioBuffer<float>&& audio, int sampleRate);

    void unload();

    bool isLoaded() const noexcept  { return buffer_ != nullptr; }
    bool isLoading() const noexcept { return loading_; }
    SampleBuffer::Ptr getBuffer() const noexcept { return buffer_; }
    uint32_t getGeneration() const noexcept { return generation_; }

    //==============================================================================
    // Settings
    void setRmsWindow (int windowSamples);
    void setRmsWindowMs (int ms);
    int getRmsWindow() const noexcept { return rms_.getWindow(); }

    void setFftParams (int fftSize, dsp::WindowFunction window);

    /** Returns false (and changes nothing) for unknown colormap names. */
    bool setColormap (const juce::String& name);

    void setDbFloor (float db);
    void setDbCeil (float db);

    void applySettings (const config::EngineSettings& newSettings);
    const config::EngineSettings& getSettings() const noexcept { return settings_; }

    state::ViewModel& view() noexcept             { return view_; }
    const state::ViewModel& view() const noexcept { return view_; }

    //==============================================================================
    // Pull outputs
    const dsp::PeakEntry& getPeaks (SampleRange range, int width);
    const dsp::RmsEnvelope& getRmsEnvelope (SampleRange range, int width);

    std::optional<dsp::PeakMarker> getPeakMarker();
    std::optional<dsp::RmsMaxMarker> getRmsMaxMarker();

    juce::Image getSpectrogramImage (SampleRange range, juce::Range<float> melView, int width, int height);

    SpectrogramState getSpectrogramState() const noexcept { return spectrogramState_; }
    dsp::MelSpectrogramPtr getSpectrogram() const noexcept { return spectrogram_; }

    dsp::PeakCache::BuildKind getLastPeakBuildKind() const noexcept { return peaks_.getLastBuildKind(); }
    bool wasSpectrogramImageRebuilt() const noexcept { return imageCache_.wasRebuilt(); }

    //==============================================================================
    /** Installs finished background results. Interactive thread only.
        Returns the number of results that were installed (stale ones are dropped).
    */
    int handleCompletedTasks();

    /** Blocks until the worker is idle. Returns false on timeout. */
    bool waitForBackgroundTasks (int timeoutMs) const { return worker_.waitForIdle (timeoutMs); }

    // Push outputs (interactive thread, from handleCompletedTasks)
    std::function<void (const LoadResult&)> onLoadComplete;
    std::function<void()> onSpectrogramReady;

private:
    juce::Result activate (juce::Result created, SampleBuffer::Ptr buffer);
    void installLoad (const LoadResult& result);
    void installSpectrogram (const SpectrogramResult& result);
    bool matchesCurrentAnalysis (const dsp::FftParams& fft, const dsp::MelOptions& mel) const noexcept;
    void launchSpectrogramRecompute();
    int currentRmsWindowSamples() const noexcept;

    config::EngineSettings settings_;
    std::optional<int> rmsWindowOverride_;   // set by setRmsWindow (samples)

    SampleBuffer::Ptr buffer_;
    uint32_t generation_ = 0;
    bool loading_ = false;

    state::ViewModel view_;
    dsp::PeakCache peaks_;
    dsp::RmsEngine rms_;

    SpectrogramState spectrogramState_ = SpectrogramState::Unavailable;
    dsp::MelSpectrogramPtr spectrogram_;
    ui::SpectrogramImageCache imageCache_;

    int installedCount_ = 0;
    dsp::PeakEntry emptyPeaks_;

    ComputeWorker worker_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (VisualizationEngine)
};

} // namespace SessionScope
