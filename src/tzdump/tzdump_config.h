// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <SimpleIni.h>

#include "common/settings.h"

/**
 * Loads Settings::values from an INI file. Groups are the setting categories ("Core",
 * "Miscellaneous") and keys are the setting labels. Keys that are absent keep their defaults.
 */
class TzdumpConfig final {
public:
    explicit TzdumpConfig(std::string config_path);
    ~TzdumpConfig();

    /// Returns false when the file could not be read. Settings then keep their defaults.
    [[nodiscard]] bool IsLoaded() const {
        return loaded;
    }

    void ReloadAllValues();

    /// Entries, as "Section.key=value", whose values could not be converted on the last load.
    /// Those settings were reset to their defaults.
    [[nodiscard]] const std::vector<std::string>& InvalidEntries() const {
        return invalid_entries;
    }

private:
    void SetUpIni();
    void ReadValues();
    void ReadCategory(Settings::Category category);
    void ReadSettingGeneric(Settings::BasicSetting* setting, const std::string& section);

    std::unique_ptr<CSimpleIniA> config;
    std::string config_loc;
    std::vector<std::string> invalid_entries;
    bool loaded{};
};
