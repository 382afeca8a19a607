/*
  ==============================================================================

    SampleBuffer.h
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <memory>
#include <vector>

namespace SessionScope
{

/**
    Fully decoded, multi-channel audio for one track.

    Immutable once created: a new load always builds a new SampleBuffer and the
    previous one is released when the last reader (UI or a background task)
    drops its shared_ptr.
*/
class SampleBuffer
{
public:
    using Ptr = std::shared_ptr<const SampleBuffer>;

    /** Copies the channel arrays into a new buffer.
        Fails with a ConfigurationError if channel lengths differ or the
        sample rate is not positive. An empty channel list is a valid, empty
        buffer.
    */
    static juce::Result create (const std::vector<std::vector<float>>& channels,
                                int sampleRate,
                                Ptr& result);

    /** Takes over an already decoded AudioBuffer. */
    static juce::Result create (juce::AudioBuffer<float>&& audio,
                                int sampleRate,
                                Ptr& result);

    int getNumChannels() const noexcept       { return audio_.getNumChannels(); }
    juce::int64 getNumSamples() const noexcept { return static_cast<juce::int64> (audio_.getNumSamples()); }
    int getSampleRate() const noexcept        { return sampleRate_; }
    bool isEmpty() const noexcept             { return getNumChannels() == 0 || getNumSamples() == 0; }

    const float* getReadPointer (int channel) const noexcept { return audio_.getReadPointer (channel); }
    float getSample (int channel, juce::int64 index) const noexcept
    {
        return audio_.getSample (channel, static_cast<int> (index));
    }

    const juce::AudioBuffer<float>& getAudio() const noexcept { return audio_; }

private:
    SampleBuffer (juce::AudioBuffer<float>&& audio, int sampleRate);

    juce::AudioBuffer<float> audio_;
    int sampleRate_ = 44100;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (SampleBuffer)
};

} // namespace SessionScope
