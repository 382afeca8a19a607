#include "ColormapTable.h"
#include <cmath>
#include <utility>
#include <vector>

namespace SessionScope::ui
{

namespace
{

struct ControlPoint
{
    float position;
    int r, g, b;
};

ColormapTable::Lut buildLut (const std::vector<ControlPoint>& points)
{
    jassert (points.size() >= 2);

    ColormapTable::Lut table{};

    for (int i = 0; i < ColormapTable::kNumEntries; ++i)
    {
        const float t = static_cast<float> (i) / static_cast<float> (ColormapTable::kNumEntries - 1);

        // Segment containing t
        std::size_t seg = 0;
        while (seg + 2 < points.size() && t > points[seg + 1].position)
            ++seg;

        const auto& a = points[seg];
        const auto& b = points[seg + 1];
        const float span = b.position - a.position;
        const float frac = span > 0.0f ? juce::jlimit (0.0f, 1.0f, (t - a.position) / span) : 0.0f;

        auto lerp = [frac] (int from, int to)
        {
            const float v = static_cast<float> (from) + frac * static_cast<float> (to - from);
            return static_cast<juce::uint8> (juce::jlimit (0.0f, 255.0f, v));
        };

        auto& entry = table[static_cast<std::size_t> (i)];
        entry[0] = lerp (a.r, b.r);
        entry[1] = lerp (a.g, b.g);
        entry[2] = lerp (a.b, b.b);
        entry[3] = 255;
    }

    return table;
}

using Registry = std::vector<std::pair<juce::String, ColormapTable::Lut>>;

const Registry& getRegistry()
{
    static const Registry registry = []
    {
        Registry r;

        r.emplace_back ("magma", buildLut ({ { 0.00f,   0,   0,   4 },
                                             { 0.25f,  81,  18, 124 },
                                             { 0.50f, 183,  55, 121 },
                                             { 0.75f, 254, 159, 109 },
                                             { 1.00f, 252, 253, 191 } }));

        r.emplace_back ("viridis", buildLut ({ { 0.00f,  68,   1,  84 },
                                               { 0.25f,  59,  82, 139 },
                                               { 0.50f,  33, 145, 140 },
                                               { 0.75f,  94, 201,  98 },
                                               { 1.00f, 253, 231,  37 } }));

        r.emplace_back ("grayscale", buildLut ({ { 0.0f,   0,   0,   0 },
                                                 { 1.0f, 255, 255, 255 } }));

        return r;
    }();

    return registry;
}

} // namespace

//==============================================================================
const ColormapTable::Lut* ColormapTable::lut (const juce::String& name)
{
    for (const auto& [key, table] : getRegistry())
        if (key == name)
            return &table;

    return nullptr;
}

juce::StringArray ColormapTable::names()
{
    juce::StringArray result;
    for (const auto& entry : getRegistry())
        result.add (entry.first);

    return result;
}

int ColormapTable::indexFor (float normalized) noexcept
{
    if (! (normalized > 0.0f))   // also catches NaN
        return 0;

    const float clamped = juce::jmin (normalized, 1.0f);
    return juce::jlimit (0, kNumEntries - 1, static_cast<int> (std::floor (clamped * 255.0f)));
}

juce::Colour ColormapTable::colourAt (const Lut& table, int index) noexcept
{
    const auto& e = table[static_cast<std::size_t> (juce::jlimit (0, kNumEntries - 1, index))];
    return juce::Colour (e[0], e[1], e[2], e[3]);
}

} // namespace SessionScope::ui
