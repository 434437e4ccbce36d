// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <string>

#include "common/common_types.h"
#include "common/settings_common.h"
#include "common/settings_enums.h"
#include "common/settings_setting.h"

namespace Settings {

const char* TranslateCategory(Settings::Category category);

struct Values {
    Linkage linkage{};

    // Core
    Setting<LimitsProfile> limits_profile{linkage, LimitsProfile::Sensible, "limits_profile",
                                          Category::Core};
    Setting<TypeIndexPolicy> type_index_policy{linkage, TypeIndexPolicy::Fail,
                                               "type_index_policy", Category::Core};
    Setting<bool> sort_transitions{linkage, true, "sort_transitions", Category::Core};
    Setting<bool> show_raw{linkage, false, "show_raw", Category::Core};

    // Miscellaneous
    Setting<std::string> log_filter{linkage, "*:Info", "log_filter", Category::Miscellaneous};
    Setting<std::string> log_file{linkage, "", "log_file", Category::Miscellaneous};
};

extern Values values;

void LogSettings();

/// Restores every registered setting to its default value.
void RestoreDefaults();

} // namespace Settings
