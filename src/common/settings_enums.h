// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>

#include "common/common_types.h"

namespace Settings {

/// Name to value table for an enumeration declared with SETTINGS_ENUM.
template <typename T>
struct EnumMetadata {
    static std::vector<std::pair<std::string, T>> Canonicalizations();
};

// Enumerations are limited to three enumerators.
#define SETTINGS_ENUM_PAIR_2(E, X) {#X, E::X}
#define SETTINGS_ENUM_PAIR_1(E, X, ...) {#X, E::X} __VA_OPT__(, SETTINGS_ENUM_PAIR_2(E, __VA_ARGS__))
#define SETTINGS_ENUM_PAIR(E, X, ...) {#X, E::X} __VA_OPT__(, SETTINGS_ENUM_PAIR_1(E, __VA_ARGS__))

#define SETTINGS_ENUM(NAME, ...)                                                                   \
    enum class NAME : u32 { __VA_ARGS__ };                                                         \
    template <>                                                                                    \
    inline std::vector<std::pair<std::string, NAME>> EnumMetadata<NAME>::Canonicalizations() {     \
        return {SETTINGS_ENUM_PAIR(NAME, __VA_ARGS__)};                                            \
    }

/// Header count limits applied while parsing. See Zoneinfo::Limits.
SETTINGS_ENUM(LimitsProfile, Sensible, None);

/// What to do with transitions referring to a nonexistent local time type.
SETTINGS_ENUM(TypeIndexPolicy, Fail, ClampToFirst);

template <typename Type>
inline std::string CanonicalizeEnum(Type id) {
    for (const auto& [name, value] : EnumMetadata<Type>::Canonicalizations()) {
        if (value == id) {
            return name;
        }
    }
    return "unknown";
}

/// Looks up an enumerator by name, ignoring case.
template <typename Type>
inline std::optional<Type> ToEnum(const std::string& canonicalization) {
    for (const auto& [name, value] : EnumMetadata<Type>::Canonicalizations()) {
        if (boost::algorithm::iequals(name, canonicalization)) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace Settings

#undef SETTINGS_ENUM
#undef SETTINGS_ENUM_PAIR
#undef SETTINGS_ENUM_PAIR_1
#undef SETTINGS_ENUM_PAIR_2
