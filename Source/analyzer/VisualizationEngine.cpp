/*
  ==============================================================================

    VisualizationEngine.cpp
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#include "VisualizationEngine.h"
#include "../config/DevFlags.h"
#include "../ui/spectrogram/ColormapTable.h"
#include <cmath>

namespace SessionScope
{

VisualizationEngine::VisualizationEngine (const config::EngineSettings& settings)
    : settings_ (settings.validated())
{
    view_.reset (0, 44100, settings_.minFrequencyHz, settings_.maxFrequencyHz);

    worker_.onLoadComplete = [this] (const LoadResult& result) { installLoad (result); };
    worker_.onSpectrogramReady = [this] (const SpectrogramResult& result) { installSpectrogram (result); };
}

VisualizationEngine::~VisualizationEngine()
{
    worker_.cancelAll();
}

//==============================================================================
juce::Result VisualizationEngine::load (const std::vector<std::vector<float>>& channels, int sampleRate)
{
    SampleBuffer::Ptr buffer;
    auto created = SampleBuffer::create (channels, sampleRate, buffer);
    return activate (created, std::move (buffer));
}

juce::Result VisualizationEngine::load (juce::AudioBuffer<float>&& audio, int sampleRate)
{
    SampleBuffer::Ptr buffer;
    auto created = SampleBuffer::create (std::move (audio), sampleRate, buffer);
    return activate (created, std::move (buffer));
}

juce::Result VisualizationEngine::activate (juce::Result created, SampleBuffer::Ptr buffer)
{
    if (created.failed())
    {
        DBG ("VisualizationEngine: load rejected: " << created.getErrorMessage());
        return created;
    }

    jassert (buffer != nullptr);

    ++generation_;
    buffer_ = std::move (buffer);
    loading_ = true;

    peaks_.invalidate();
    imageCache_.invalidate();
    spectrogram_.reset();
    spectrogramState_ = SpectrogramState::Computing;

    rms_.setBuffer (buffer_);
    rms_.setWindow (currentRmsWindowSamples());

    view_.reset (buffer_->getNumSamples(), buffer_->getSampleRate(),
                 settings_.minFrequencyHz, settings_.maxFrequencyHz);

    LoadRequest request;
    request.generation = generation_;
    request.buffer = buffer_;
    request.rmsWindow = rms_.getWindow();
    request.fftParams = settings_.getFftParams();
    request.melOptions = settings_.getMelOptions();

    SESSIONSCOPE_LOG ("VisualizationEngine: loaded " + juce::String (buffer_->getNumChannels()) + " ch, "
                      + juce::String (buffer_->getNumSamples()) + " samples @ "
                      + juce::String (buffer_->getSampleRate()) + " Hz");

    worker_.startLoad (std::move (request));
    return juce::Result::ok();
}

void VisualizationEngine::unload()
{
    worker_.cancelAll();

    ++generation_;
    buffer_.reset();
    loading_ = false;

    peaks_.invalidate();
    rms_.clear();
    imageCache_.invalidate();
    spectrogram_.reset();
    spectrogramState_ = SpectrogramState::Unavailable;

    view_.reset (0, view_.getSampleRate(), settings_.minFrequencyHz, settings_.maxFrequencyHz);
}

//==============================================================================
int VisualizationEngine::currentRmsWindowSamples() const noexcept
{
    if (rmsWindowOverride_.has_value())
        return *rmsWindowOverride_;

    const int sampleRate = buffer_ != nullptr ? buffer_->getSampleRate() : view_.getSampleRate();
    return settings_.getRmsWindowSamples (sampleRate);
}

void VisualizationEngine::setRmsWindow (int windowSamples)
{
    rmsWindowOverride_ = juce::jmax (0, windowSamples);
    rms_.setWindow (*rmsWindowOverride_);
}

void VisualizationEngine::setRmsWindowMs (int ms)
{
    settings_.rmsWindowMs = juce::jmax (1, ms);
    rmsWindowOverride_.reset();
    rms_.setWindow (currentRmsWindowSamples());
}

void VisualizationEngine::setFftParams (int fftSize, dsp::WindowFunction window)
{
    const int snapped = config::EngineSettings::snapFftSize (fftSize);
    jassert (snapped == fftSize);

    if (snapped == settings_.fftSize && window == settings_.windowFunction)
        return;

    settings_.fftSize = snapped;
    settings_.windowFunction = window;
    launchSpectrogramRecompute();
}

bool VisualizationEngine::setColormap (const juce::String& name)
{
    if (! ui::ColormapTable::contains (name))
    {
        DBG ("VisualizationEngine: unknown colormap '" << name << "' ignored");
        return false;
    }

    settings_.colormap = name;
    return true;
}

void VisualizationEngine::setDbFloor (float db)
{
    if (std::isfinite (db))
        settings_.dbFloor = db;
}

void VisualizationEngine::setDbCeil (float db)
{
    if (std::isfinite (db))
        settings_.dbCeil = db;
}

void VisualizationEngine::applySettings (const config::EngineSettings& newSettings)
{
    const auto next = newSettings.validated();
    const bool melChanged = next.getMelOptions() != settings_.getMelOptions();
    const bool analysisChanged = melChanged || next.getFftParams() != settings_.getFftParams();

    settings_ = next;

    if (melChanged)
        view_.setFrequencyLimits (settings_.minFrequencyHz, settings_.maxFrequencyHz);
    rmsWindowOverride_.reset();
    rms_.setWindow (currentRmsWindowSamples());

    if (analysisChanged)
        launchSpectrogramRecompute();
}

void VisualizationEngine::launchSpectrogramRecompute()
{
    imageCache_.invalidate();

    if (buffer_ == nullptr)
        return;

    spectrogram_.reset();
    spectrogramState_ = SpectrogramState::Computing;

    SpectrogramRequest request;
    request.generation = generation_;
    request.buffer = buffer_;
    request.fftParams = settings_.getFftParams();
    request.melOptions = settings_.getMelOptions();

    worker_.startSpectrogram (std::move (request));
}

bool VisualizationEngine::matchesCurrentAnalysis (const dsp::FftParams& fft, const dsp::MelOptions& mel) const noexcept
{
    return fft == settings_.getFftParams() && mel == settings_.getMelOptions();
}

//==============================================================================
const dsp::PeakEntry& VisualizationEngine::getPeaks (SampleRange range, int width)
{
    if (buffer_ == nullptr)
        return emptyPeaks_;

    return peaks_.getPeaks (*buffer_, range, width);
}

const dsp::RmsEnvelope& VisualizationEngine::getRmsEnvelope (SampleRange range, int width)
{
    return rms_.getEnvelope (range, width);
}

std::optional<dsp::PeakMarker> VisualizationEngine::getPeakMarker()
{
    return rms_.getPeakMarker();
}

std::optional<dsp::RmsMaxMarker> VisualizationEngine::getRmsMaxMarker()
{
    return rms_.getRmsMaxMarker();
}

juce::Image VisualizationEngine::getSpectrogramImage (SampleRange range, juce::Range<float> melView, int width, int height)
{
    if (buffer_ == nullptr || spectrogramState_ != SpectrogramState::Ready)
        return {};

    return imageCache_.getImage (spectrogram_, buffer_->getNumSamples(), range, melView, width, height,
                                 settings_.colormap, settings_.dbFloor, settings_.dbCeil);
}

//==============================================================================
int VisualizationEngine::handleCompletedTasks()
{
    installedCount_ = 0;
    worker_.dispatchCompleted();
    return installedCount_;
}

void VisualizationEngine::installLoad (const LoadResult& result)
{
    if (result.generation != generation_ || result.buffer != buffer_)
    {
        DBG ("VisualizationEngine: discarding stale load result (generation "
             << juce::String (result.generation) << ", current " << juce::String (generation_) << ")");
        return;
    }

    rms_.installPrecomputed (result.cumulativeSums, result.peak, result.rmsWindow, result.rmsMax);
    loading_ = false;

    // FFT settings may have changed mid-load; a recompute is then already running
    if (matchesCurrentAnalysis (result.fftParams, result.melOptions))
    {
        spectrogram_ = result.spectrogram;
        spectrogramState_ = spectrogram_ != nullptr ? SpectrogramState::Ready : SpectrogramState::Unavailable;
        imageCache_.invalidate();

        if (spectrogram_ == nullptr)
            DBG ("VisualizationEngine: spectrogram unavailable (audio shorter than one FFT frame)");
    }

    ++installedCount_;

    if (onLoadComplete != nullptr)
        onLoadComplete (result);
}

void VisualizationEngine::installSpectrogram (const SpectrogramResult& result)
{
    if (result.generation != generation_ || ! matchesCurrentAnalysis (result.fftParams, result.melOptions))
    {
        DBG ("VisualizationEngine: discarding stale spectrogram result");
        return;
    }

    spectrogram_ = result.spectrogram;
    spectrogramState_ = spectrogram_ != nullptr ? SpectrogramState::Ready : SpectrogramState::Unavailable;
    imageCache_.invalidate();

    ++installedCount_;

    if (onSpectrogramReady != nullptr)
        onSpectrogramReady();
}

} // namespace SessionScope
