#pragma once

#include <juce_graphics/juce_graphics.h>
#include <array>

namespace SessionScope::ui
{

//==============================================================================
/**
    Named 256-entry RGBA lookup tables for spectrogram rendering.

    Tables are built once on first use and never modified afterwards, so the
    returned pointers can be shared freely.
*/
class ColormapTable
{
public:
    static constexpr int kNumEntries = 256;

    using Entry = std::array<juce::uint8, 4>;   // r, g, b, a
    using Lut = std::array<Entry, kNumEntries>;

    static constexpr const char* kDefaultName = "magma";

    /** nullptr for unknown names. */
    static const Lut* lut (const juce::String& name);

    static bool contains (const juce::String& name) { return lut (name) != nullptr; }

    /** Registered names in a stable order. */
    static juce::StringArray names();

    /** Maps a normalized value to a LUT index: floor(clamp(v, 0, 1) * 255). */
    static int indexFor (float normalized) noexcept;

    static juce::Colour colourAt (const Lut& table, int index) noexcept;

private:
    ColormapTable() = delete;
};

} // namespace SessionScope::ui
