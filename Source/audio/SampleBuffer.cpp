/*
  ==============================================================================

    SampleBuffer.cpp
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#include "SampleBuffer.h"
#include <limits>

namespace SessionScope
{

SampleBuffer::SampleBuffer (juce::AudioBuffer<float>&& audio, int sampleRate)
    : audio_ (std::move (audio)), sampleRate_ (sampleRate)
{
}

juce::Result SampleBuffer::create (const std::vector<std::vector<float>>& channels,
                                   int sampleRate,
                                   Ptr& result)
{
    if (sampleRate <= 0)
        return juce::Result::fail ("ConfigurationError: sample rate must be positive (got "
                                   + juce::String (sampleRate) + ")");

    const std::size_t length = channels.empty() ? 0 : channels.front().size();

    for (std::size_t ch = 1; ch < channels.size(); ++ch)
    {
        if (channels[ch].size() != length)
        {
            return juce::Result::fail ("ConfigurationError: channel " + juce::String (static_cast<int> (ch))
                                       + " has " + juce::String (static_cast<juce::int64> (channels[ch].size()))
                                       + " samples, expected " + juce::String (static_cast<juce::int64> (length)));
        }
    }

    if (length > static_cast<std::size_t> (std::numeric_limits<int>::max()))
        return juce::Result::fail ("ConfigurationError: channel length exceeds supported size");

    const int numChannels = static_cast<int> (channels.size());
    const int numSamples = static_cast<int> (length);

    juce::AudioBuffer<float> audio (numChannels, numSamples);
    for (int ch = 0; ch < numChannels; ++ch)
    {
        if (numSamples > 0)
            audio.copyFrom (ch, 0, channels[static_cast<std::size_t> (ch)].data(), numSamples);
    }

    result.reset (new SampleBuffer (std::move (audio), sampleRate));
    return juce::Result::ok();
}

juce::Result SampleBuffer::create (juce::AudioBuffer<float>&& audio,
                                   int sampleRate,
                                   Ptr& result)
{
    if (sampleRate <= 0)
        return juce::Result::fail ("ConfigurationError: sample rate must be positive (got "
                                   + juce::String (sampleRate) + ")");

    result.reset (new SampleBuffer (std::move (audio), sampleRate));
    return juce::Result::ok();
}

} // namespace SessionScope
