#pragma once

#include "SettingIds.h"
#include <string_view>

namespace SessionScope
{

struct SettingSpec
{
    SettingId id{};
    SettingGroup group{};
    std::string_view stableKey{};
};

const SettingSpec& getSettingSpec (SettingId id) noexcept;
std::string_view toStableKey (SettingId id) noexcept;
std::string_view toGroupName (SettingGroup group) noexcept;

} // namespace SessionScope
