// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <string>
#include "common/settings_common.h"

namespace Settings {

Linkage::Linkage(u32 initial_count) : count{initial_count} {}
Linkage::~Linkage() = default;

BasicSetting::BasicSetting(Linkage& linkage, const std::string& name, Category category_,
                           bool save_)
    : label{name}, category{category_}, save{save_} {
    linkage.by_key.emplace(label, this);
    linkage.by_category[category].push_back(this);
    ++linkage.count;
}

BasicSetting::~BasicSetting() = default;

bool BasicSetting::Save() const {
    return save;
}

const std::string& BasicSetting::GetLabel() const {
    return label;
}

} // namespace Settings
