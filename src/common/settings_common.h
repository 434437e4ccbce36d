// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <map>
#include <string>
#include <vector>
#include "common/common_types.h"

namespace Settings {

/// INI group a setting is read from.
enum class Category : u32 {
    Core,
    Miscellaneous,
    MaxEnum,
};

class BasicSetting;

/// Registry every Setting adds itself to on construction, so settings can be walked by group
/// or looked up by label.
class Linkage {
public:
    explicit Linkage(u32 initial_count = 0);
    ~Linkage();
    std::map<Category, std::vector<BasicSetting*>> by_category{};
    std::map<std::string, BasicSetting*> by_key{};
    u32 count;
};

/**
 * Type-erased view of a Setting. Frontends use it to load and print values as strings without
 * knowing the type behind them.
 */
class BasicSetting {
protected:
    explicit BasicSetting(Linkage& linkage, const std::string& name, Category category_,
                          bool save_);

public:
    virtual ~BasicSetting();

    [[nodiscard]] virtual std::string ToString() const = 0;
    [[nodiscard]] virtual std::string DefaultToString() const = 0;

    /**
     * Converts `load` to the setting's type and stores it. Enumerations accept their canonical
     * names in any case. Input that cannot be converted restores the default.
     */
    virtual void LoadString(const std::string& load) = 0;

    /// As LoadString, but input that cannot be converted is rejected: the value is left as it
    /// was and false is returned.
    [[nodiscard]] virtual bool TryLoadString(const std::string& load) = 0;

    /// As ToString, but enumerations are printed by name, e.g. "Sensible".
    [[nodiscard]] virtual std::string Canonicalize() const = 0;

    virtual void Reset() = 0;

    /// Whether the setting should be read from configuration files at all.
    [[nodiscard]] bool Save() const;

    [[nodiscard]] const std::string& GetLabel() const;

private:
    const std::string label;
    const Category category;
    const bool save;
};

} // namespace Settings
