#pragma once

#include "audio/SampleBuffer.h"
#include <catch2/catch.hpp>
#include <cmath>
#include <vector>

namespace SessionScope::test
{

using Channels = std::vector<std::vector<float>>;

inline std::vector<float> sine (std::size_t numSamples, double frequency, double sampleRate, float amplitude = 0.5f)
{
    std::vector<float> out (numSamples);
    const double w = juce::MathConstants<double>::twoPi * frequency / sampleRate;

    for (std::size_t i = 0; i < numSamples; ++i)
        out[i] = amplitude * static_cast<float> (std::sin (w * static_cast<double> (i)));

    return out;
}

/** Deterministic pseudo-random signal in [-amplitude, amplitude]. */
inline std::vector<float> noise (std::size_t numSamples, int seed, float amplitude = 0.5f)
{
    juce::Random rng (seed);
    std::vector<float> out (numSamples);

    for (auto& s : out)
        s = amplitude * (rng.nextFloat() * 2.0f - 1.0f);

    return out;
}

inline SampleBuffer::Ptr makeBuffer (const Channels& channels, int sampleRate)
{
    SampleBuffer::Ptr buffer;
    const auto result = SampleBuffer::create (channels, sampleRate, buffer);
    REQUIRE (result.wasOk());
    REQUIRE (buffer != nullptr);
    return buffer;
}

} // namespace SessionScope::test
