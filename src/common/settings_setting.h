// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "common/common_types.h"
#include "common/logging/log.h"
#include "common/settings_common.h"
#include "common/settings_enums.h"

namespace Settings {

/**
 * A named value with a default, registered in a Linkage so configuration frontends can find it.
 * Supported types are bool, std::string, integers and enumerations declared in
 * settings_enums.h.
 */
template <typename Type>
class Setting final : public BasicSetting {
public:
    /**
     * @param linkage Registry the setting adds itself to
     * @param default_val Initial and default value
     * @param name Label, also the INI key
     * @param category_ INI group
     * @param save_ Whether configuration files may set this value
     */
    explicit Setting(Linkage& linkage, const Type& default_val, const std::string& name,
                     Category category_, bool save_ = true)
        : BasicSetting(linkage, name, category_, save_), value{default_val},
          default_value{default_val} {}
    ~Setting() override = default;

    [[nodiscard]] const Type& GetValue() const {
        return value;
    }

    const Type& operator=(const Type& val) {
        value = val;
        return value;
    }

    [[nodiscard]] std::string ToString() const override {
        return Format(value);
    }

    [[nodiscard]] std::string DefaultToString() const override {
        return Format(default_value);
    }

    void LoadString(const std::string& input) override {
        if (boost::algorithm::trim_copy(input).empty()) {
            Reset();
            return;
        }
        if (!TryLoadString(input)) {
            LOG_ERROR(Config, "Invalid value '{}' for setting {}, using default {}", input,
                      GetLabel(), DefaultToString());
            Reset();
        }
    }

    /// Booleans accept true/false in any case, and 1/0.
    [[nodiscard]] bool TryLoadString(const std::string& input) override {
        const std::string trimmed = boost::algorithm::trim_copy(input);

        if constexpr (std::is_same_v<Type, std::string>) {
            value = trimmed;
            return true;
        } else if constexpr (std::is_same_v<Type, bool>) {
            if (boost::algorithm::iequals(trimmed, "true") || trimmed == "1") {
                value = true;
                return true;
            }
            if (boost::algorithm::iequals(trimmed, "false") || trimmed == "0") {
                value = false;
                return true;
            }
            return false;
        } else if constexpr (std::is_enum_v<Type>) {
            const auto parsed = ToEnum<Type>(trimmed);
            if (!parsed) {
                return false;
            }
            value = *parsed;
            return true;
        } else {
            try {
                value = static_cast<Type>(std::stoll(trimmed));
                return true;
            } catch (const std::invalid_argument&) {
                return false;
            } catch (const std::out_of_range&) {
                return false;
            }
        }
    }

    [[nodiscard]] std::string Canonicalize() const override {
        return ToString();
    }

    void Reset() override {
        value = default_value;
    }

private:
    [[nodiscard]] static std::string Format(const Type& val) {
        if constexpr (std::is_same_v<Type, std::string>) {
            return val;
        } else if constexpr (std::is_same_v<Type, bool>) {
            return val ? "true" : "false";
        } else if constexpr (std::is_enum_v<Type>) {
            return CanonicalizeEnum(val);
        } else {
            return std::to_string(val);
        }
    }

    Type value{};
    const Type default_value{};
};

} // namespace Settings
