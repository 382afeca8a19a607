/*
  ==============================================================================

    RmsEngine.cpp
    Created: 19 Oct 2026
    Author:  Antigravity

  ==============================================================================
*/

#include "RmsEngine.h"
#include "../../config/DevFlags.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

namespace SessionScope::dsp
{

namespace
{

/** Windowed-mean index range [first, last) covering pixel samples [s0, s1).
    Windows are reported at their centre, hence the -halfWindow shift.
    An empty range falls back to the single value nearest the pixel start.
*/
std::pair<juce::int64, juce::int64> pixelValueRange (juce::int64 s0, juce::int64 s1,
                                                     juce::int64 halfWindow, juce::int64 numValues) noexcept
{
    auto first = juce::jlimit<juce::int64> (0, numValues, s0 - halfWindow);
    auto last  = juce::jlimit<juce::int64> (0, numValues, s1 - halfWindow);

    if (last <= first)
    {
        first = juce::jlimit<juce::int64> (0, numValues - 1, s0 - halfWindow);
        last = first + 1;
    }

    return { first, last };
}

} // namespace

//==============================================================================
void RmsEngine::setBuffer (SampleBuffer::Ptr buffer)
{
    buffer_ = std::move (buffer);
    sums_.reset();
    resetEnvelope();
    peak_.markDirty();
    rmsMax_.markDirty();
}

void RmsEngine::clear()
{
    setBuffer (nullptr);
}

void RmsEngine::setWindow (int windowSamples)
{
    const int newWindow = juce::jmax (0, windowSamples);
    if (newWindow == window_)
        return;

    window_ = newWindow;
    resetEnvelope();
    rmsMax_.markDirty();
}

void RmsEngine::installPrecomputed (std::shared_ptr<const CumulativeSums> sums,
                                    std::optional<PeakMarker> peak,
                                    int rmsMaxWindow,
                                    std::optional<RmsMaxMarker> rmsMax)
{
    jassert (buffer_ != nullptr);

    if (sums != nullptr && static_cast<int> (sums->size()) == buffer_->getNumChannels())
        sums_ = std::move (sums);

    peak_.setClean (peak);

    // The window may have changed while the load task was running.
    if (rmsMaxWindow == window_)
        rmsMax_.setClean (rmsMax);
    else
        rmsMax_.markDirty();

    resetEnvelope();
}

void RmsEngine::resetEnvelope()
{
    envelope_ = RmsEnvelope{};
    envelopeValid_ = false;
}

const CumulativeSums& RmsEngine::ensureCumulativeSums()
{
    if (sums_ == nullptr)
    {
        jassert (buffer_ != nullptr);
        SESSIONSCOPE_LOG ("RmsEngine: building cumulative sums on the interactive thread");
        sums_ = buildCumulativeSums (*buffer_);
    }

    return *sums_;
}

//==============================================================================
const RmsEnvelope& RmsEngine::getEnvelope (SampleRange view, int width)
{
    if (buffer_ == nullptr || buffer_->getNumChannels() == 0 || window_ <= 0 || width <= 0)
    {
        resetEnvelope();
        return envelope_;
    }

    view = view.getIntersectionWith ({ 0, buffer_->getNumSamples() });
    if (view.isEmpty())
    {
        resetEnvelope();
        return envelope_;
    }

    if (envelopeValid_ && envelope_.width == width && envelope_.view == view && envelope_.window == window_)
        return envelope_;

    const auto& sums = ensureCumulativeSums();
    const int numChannels = static_cast<int> (sums.size());
    const std::size_t widthSz = static_cast<std::size_t> (width);
    const juce::int64 viewLen = view.getLength();
    const juce::int64 halfWindow = window_ / 2;

    envelope_.width = width;
    envelope_.window = window_;
    envelope_.view = view;
    envelope_.channels.assign (static_cast<std::size_t> (numChannels), std::vector<float> (widthSz, 0.0f));
    envelope_.combined.assign (widthSz, 0.0f);

    juce::int64 numCombined = std::numeric_limits<juce::int64>::max();
    for (const auto& cs : sums)
        numCombined = juce::jmin (numCombined, numWindowedValues (cs, window_));

    const double channelScale = 1.0 / static_cast<double> (numChannels);

    for (int p = 0; p < width; ++p)
    {
        const juce::int64 s0 = view.getStart() + static_cast<juce::int64> (p) * viewLen / width;
        const juce::int64 s1 = view.getStart() + static_cast<juce::int64> (p + 1) * viewLen / width;
        const std::size_t px = static_cast<std::size_t> (p);

        // Peak-hold: the loudest window inside the pixel wins.
        for (int ch = 0; ch < numChannels; ++ch)
        {
            const auto& cs = sums[static_cast<std::size_t> (ch)];
            const auto [first, last] = pixelValueRange (s0, s1, halfWindow, numWindowedValues (cs, window_));

            double maxMs = 0.0;
            for (juce::int64 k = first; k < last; ++k)
                maxMs = juce::jmax (maxMs, windowedMeanSquare (cs, window_, k));

            envelope_.channels[static_cast<std::size_t> (ch)][px] = static_cast<float> (std::sqrt (maxMs));
        }

        // Combined: average channels in the power domain first, then peak-hold.
        const auto [first, last] = pixelValueRange (s0, s1, halfWindow, numCombined);

        double maxCombined = 0.0;
        for (juce::int64 k = first; k < last; ++k)
        {
            double sum = 0.0;
            for (const auto& cs : sums)
                sum += windowedMeanSquare (cs, window_, k);

            maxCombined = juce::jmax (maxCombined, sum * channelScale);
        }

        envelope_.combined[px] = static_cast<float> (std::sqrt (maxCombined));
    }

    envelopeValid_ = true;

    SESSIONSCOPE_TRACE ("RmsEngine envelope width=" + juce::String (width) + " window=" + juce::String (window_));

    return envelope_;
}

std::optional<PeakMarker> RmsEngine::getPeakMarker()
{
    if (buffer_ == nullptr)
        return std::nullopt;

    return peak_.get ([this] { return findPeak (*buffer_); });
}

std::optional<RmsMaxMarker> RmsEngine::getRmsMaxMarker()
{
    if (buffer_ == nullptr || buffer_->getNumChannels() == 0 || window_ <= 0)
        return std::nullopt;

    return rmsMax_.get ([this] { return findRmsMax (ensureCumulativeSums(), window_); });
}

//==============================================================================
std::shared_ptr<const CumulativeSums> RmsEngine::buildCumulativeSums (const SampleBuffer& buffer,
                                                                      const ShouldCancel& shouldCancel)
{
    auto sums = std::make_shared<CumulativeSums> (static_cast<std::size_t> (buffer.getNumChannels()));
    const juce::int64 n = buffer.getNumSamples();

    for (int ch = 0; ch < buffer.getNumChannels(); ++ch)
    {
        if (isCancelled (shouldCancel))
            return nullptr;

        auto& cs = (*sums)[static_cast<std::size_t> (ch)];
        cs.resize (static_cast<std::size_t> (n + 1));
        cs[0] = 0.0;

        const float* data = buffer.getReadPointer (ch);
        double running = 0.0;
        for (juce::int64 i = 0; i < n; ++i)
        {
            const double x = static_cast<double> (data[i]);
            running += x * x;
            cs[static_cast<std::size_t> (i + 1)] = running;
        }
    }

    return sums;
}

juce::int64 RmsEngine::numWindowedValues (const std::vector<double>& sums, int window) noexcept
{
    const juce::int64 n = static_cast<juce::int64> (sums.size()) - 1;
    if (window <= 0 || n <= window)
        return 1;

    return n - window + 1;
}

double RmsEngine::windowedMeanSquare (const std::vector<double>& sums, int window, juce::int64 k) noexcept
{
    const juce::int64 n = static_cast<juce::int64> (sums.size()) - 1;
    if (window <= 0 || n <= window || k < 0 || k > n - window)
        return 0.0;

    const double ms = (sums[static_cast<std::size_t> (k + window)] - sums[static_cast<std::size_t> (k)])
                      / static_cast<double> (window);

    // Rounding in long running sums can leave tiny negative residues.
    return juce::jmax (0.0, ms);
}

std::optional<PeakMarker> RmsEngine::findPeak (const SampleBuffer& buffer, const ShouldCancel& shouldCancel)
{
    const juce::int64 n = buffer.getNumSamples();
    if (buffer.getNumChannels() == 0 || n == 0)
        return std::nullopt;

    PeakMarker best;
    float bestAbs = -1.0f;

    for (int ch = 0; ch < buffer.getNumChannels(); ++ch)
    {
        if (isCancelled (shouldCancel))
            return std::nullopt;

        const float* data = buffer.getReadPointer (ch);
        juce::int64 chIndex = 0;
        float chAbs = -1.0f;

        for (juce::int64 i = 0; i < n; ++i)
        {
            const float a = std::abs (data[i]);
            if (a > chAbs)
            {
                chAbs = a;
                chIndex = i;
            }
        }

        // Louder wins; on a tie the earlier sample (then the lower channel) wins.
        if (chAbs > bestAbs || (chAbs == bestAbs && chIndex < best.sampleIndex))
        {
            bestAbs = chAbs;
            best.sampleIndex = chIndex;
            best.channel = ch;
            best.amplitude = data[chIndex];
        }
    }

    best.db = gainToDb (bestAbs);
    return best;
}

std::optional<RmsMaxMarker> RmsEngine::findRmsMax (const CumulativeSums& sums,
                                                   int window,
                                                   const ShouldCancel& shouldCancel)
{
    if (sums.empty() || window <= 0)
        return std::nullopt;

    juce::int64 numCombined = std::numeric_limits<juce::int64>::max();
    for (const auto& cs : sums)
        numCombined = juce::jmin (numCombined, numWindowedValues (cs, window));

    const double channelScale = 1.0 / static_cast<double> (sums.size());
    std::vector<double> combined (static_cast<std::size_t> (numCombined), 0.0);

    for (const auto& cs : sums)
    {
        if (isCancelled (shouldCancel))
            return std::nullopt;

        for (juce::int64 k = 0; k < numCombined; ++k)
            combined[static_cast<std::size_t> (k)] += windowedMeanSquare (cs, window, k) * channelScale;
    }

    const auto maxIt = std::max_element (combined.begin(), combined.end());
    const auto maxIdx = static_cast<juce::int64> (std::distance (combined.begin(), maxIt));
    const double rms = std::sqrt (*maxIt);

    RmsMaxMarker marker;
    marker.sampleIndex = maxIdx + window / 2;
    marker.amplitude = static_cast<float> (rms);
    marker.db = gainToDb (rms);
    return marker;
}

float RmsEngine::gainToDb (double gain) noexcept
{
    if (gain <= 0.0)
        return -std::numeric_limits<float>::infinity();

    return static_cast<float> (20.0 * std::log10 (gain));
}

} // namespace SessionScope::dsp
