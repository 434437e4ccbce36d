// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <algorithm>
#include <cstdio>
#include <utility>

#include <boost/algorithm/string/replace.hpp>
#include <fmt/format.h>

#include "common/logging/log.h"
#include "tzdump/tzdump_config.h"

TzdumpConfig::TzdumpConfig(std::string config_path) : config_loc{std::move(config_path)} {
    ReloadAllValues();
}

TzdumpConfig::~TzdumpConfig() = default;

void TzdumpConfig::ReloadAllValues() {
    SetUpIni();
    if (loaded) {
        ReadValues();
    }
}

void TzdumpConfig::SetUpIni() {
    config = std::make_unique<CSimpleIniA>();
    config->SetUnicode(true);
    config->SetSpaces(false);
    loaded = false;
    invalid_entries.clear();

    FILE* fp = std::fopen(config_loc.c_str(), "rb");
    if (fp == nullptr) {
        LOG_ERROR(Config, "Config file {} could not be opened", config_loc);
        return;
    }

    if (SI_Error rc = config->LoadFile(fp); rc < 0) {
        LOG_ERROR(Config, "Config file {} could not be loaded (error {})", config_loc,
                  static_cast<int>(rc));
    } else {
        loaded = true;
    }
    std::fclose(fp);
}

void TzdumpConfig::ReadValues() {
    ReadCategory(Settings::Category::Core);
    ReadCategory(Settings::Category::Miscellaneous);
}

void TzdumpConfig::ReadCategory(Settings::Category category) {
    const std::string section = Settings::TranslateCategory(category);
    const auto& settings = Settings::values.linkage.by_category[category];
    std::ranges::for_each(settings,
                          [&](const auto& setting) { ReadSettingGeneric(setting, section); });
}

void TzdumpConfig::ReadSettingGeneric(Settings::BasicSetting* const setting,
                                      const std::string& section) {
    if (!setting->Save()) {
        return;
    }

    const char* value = config->GetValue(section.c_str(), setting->GetLabel().c_str(), nullptr);
    if (value == nullptr) {
        return;
    }

    std::string setting_string{value};
    boost::replace_all(setting_string, "\"", "");
    if (!setting->TryLoadString(setting_string)) {
        invalid_entries.push_back(fmt::format("{}.{}={}", section, setting->GetLabel(), value));
        setting->Reset();
    }
}
