// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <string>
#include <string_view>

#include "common/assert.h"
#include "common/logging/log.h"
#include "common/settings.h"

namespace Settings {

Values values;

void LogSettings() {
    const auto log_setting = [](std::string_view name, const auto& value) {
        LOG_INFO(Config, "{}: {}", name, value);
    };

    LOG_INFO(Config, "zoneinfo Configuration:");
    for (auto& [category, settings] : values.linkage.by_category) {
        for (const auto& setting : settings) {
            const std::string name = fmt::format("{}.{}", TranslateCategory(category),
                                                 setting->GetLabel());
            log_setting(name, setting->Canonicalize());
        }
    }
}

void RestoreDefaults() {
    for (auto& [key, setting] : values.linkage.by_key) {
        setting->Reset();
    }
}

const char* TranslateCategory(Category category) {
    switch (category) {
    case Category::Core:
        return "Core";
    case Category::Miscellaneous:
        return "Miscellaneous";
    case Category::MaxEnum:
        break;
    }
    UNREACHABLE_MSG("Invalid settings category {}", static_cast<u32>(category));
}

} // namespace Settings
