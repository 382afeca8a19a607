#include "SettingSpecs.h"
#include <array>
#include <cassert>

namespace SessionScope
{

namespace
{

constexpr std::array<const char*, static_cast<std::size_t>(SettingGroup::Count)> kGroupNames = {
    "waveform",
    "spectrogram"
};

// Spec table - must match SettingId enum order exactly
constexpr std::array<SettingSpec, static_cast<std::size_t>(SettingId::Count)> kSpecs = {
    SettingSpec{ SettingId::RmsWindowMs,    SettingGroup::Waveform,    "waveform.rmsWindowMs" },
    SettingSpec{ SettingId::FftSize,        SettingGroup::Spectrogram, "spectrogram.fftSize" },
    SettingSpec{ SettingId::WindowFunction, SettingGroup::Spectrogram, "spectrogram.window" },
    SettingSpec{ SettingId::Colormap,       SettingGroup::Spectrogram, "spectrogram.colormap" },
    SettingSpec{ SettingId::DbFloor,        SettingGroup::Spectrogram, "spectrogram.dbFloor" },
    SettingSpec{ SettingId::DbCeil,         SettingGroup::Spectrogram, "spectrogram.dbCeil" },
    SettingSpec{ SettingId::NumMels,        SettingGroup::Spectrogram, "spectrogram.numMels" },
    SettingSpec{ SettingId::MinFrequencyHz, SettingGroup::Spectrogram, "spectrogram.minFrequencyHz" },
    SettingSpec{ SettingId::MaxFrequencyHz, SettingGroup::Spectrogram, "spectrogram.maxFrequencyHz" },
};

// Static assert to verify order matches SettingId enum
static_assert(static_cast<std::size_t>(SettingId::Count) == kSpecs.size(),
              "Spec table size must match SettingId::Count");

constexpr bool specsAreInEnumOrder() noexcept
{
    for (std::size_t i = 0; i < kSpecs.size(); ++i)
        if (static_cast<std::size_t>(kSpecs[i].id) != i)
            return false;

    return true;
}

static_assert(specsAreInEnumOrder(), "Spec table entries must follow SettingId order");

} // namespace

const SettingSpec& getSettingSpec (SettingId id) noexcept
{
    const auto index = static_cast<std::size_t>(id);
    assert(index < static_cast<std::size_t>(SettingId::Count));
    return kSpecs[index];
}

std::string_view toStableKey (SettingId id) noexcept
{
    return getSettingSpec (id).stableKey;
}

std::string_view toGroupName (SettingGroup group) noexcept
{
    const auto index = static_cast<std::size_t>(group);
    assert(index < kGroupNames.size());
    return kGroupNames[index];
}

} // namespace SessionScope
