// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <catch2/catch_test_macros.hpp>

#include "common/logging/backend.h"
#include "common/settings.h"

namespace Settings {

TEST_CASE("Settings: Enum canonicalization", "[common]") {
    REQUIRE(ToEnum<LimitsProfile>("Sensible") == LimitsProfile::Sensible);
    REQUIRE(ToEnum<LimitsProfile>("none") == LimitsProfile::None);
    REQUIRE(ToEnum<TypeIndexPolicy>("CLAMPTOFIRST") == TypeIndexPolicy::ClampToFirst);
    REQUIRE(!ToEnum<TypeIndexPolicy>("clamp").has_value());

    REQUIRE(CanonicalizeEnum(TypeIndexPolicy::Fail) == "Fail");
    REQUIRE(CanonicalizeEnum(LimitsProfile::None) == "None");
}

TEST_CASE("Settings: LoadString", "[common]") {
    Common::Log::DisableLoggingInTests();

    Linkage linkage{};
    Setting<bool> flag{linkage, false, "flag", Category::Core};
    Setting<TypeIndexPolicy> policy{linkage, TypeIndexPolicy::Fail, "policy", Category::Core};
    Setting<std::string> text{linkage, "*:Info", "text", Category::Miscellaneous};
    Setting<u32> number{linkage, 7, "number", Category::Miscellaneous};

    REQUIRE(linkage.count == 4);

    flag.LoadString(" True ");
    REQUIRE(flag.GetValue());
    flag.LoadString("0");
    REQUIRE(!flag.GetValue());
    flag.LoadString("1");
    REQUIRE(flag.GetValue());

    policy.LoadString("clamptofirst");
    REQUIRE(policy.GetValue() == TypeIndexPolicy::ClampToFirst);
    REQUIRE(policy.Canonicalize() == "ClampToFirst");
    // Unknown names fall back to the default.
    policy.LoadString("sometimes");
    REQUIRE(policy.GetValue() == TypeIndexPolicy::Fail);

    text.LoadString("  Tzif:Debug ");
    REQUIRE(text.GetValue() == "Tzif:Debug");
    text.LoadString("");
    REQUIRE(text.GetValue() == "*:Info");

    number.LoadString("42");
    REQUIRE(number.GetValue() == 42);
    number.LoadString("lots");
    REQUIRE(number.GetValue() == 7);

    flag.Reset();
    REQUIRE(!flag.GetValue());
}

TEST_CASE("Settings: TryLoadString rejects unknown values", "[common]") {
    Linkage linkage{};
    Setting<TypeIndexPolicy> policy{linkage, TypeIndexPolicy::Fail, "policy", Category::Core};
    Setting<LimitsProfile> limits{linkage, LimitsProfile::Sensible, "limits", Category::Core};
    Setting<bool> flag{linkage, true, "flag", Category::Core};
    Setting<u32> number{linkage, 7, "number", Category::Miscellaneous};

    REQUIRE(policy.TryLoadString(" ClampToFirst "));
    REQUIRE(policy.GetValue() == TypeIndexPolicy::ClampToFirst);

    // A rejected value leaves the previous one in place.
    REQUIRE(!policy.TryLoadString("clamp"));
    REQUIRE(policy.GetValue() == TypeIndexPolicy::ClampToFirst);

    REQUIRE(limits.TryLoadString("NONE"));
    REQUIRE(limits.GetValue() == LimitsProfile::None);
    REQUIRE(!limits.TryLoadString("strict"));
    REQUIRE(limits.GetValue() == LimitsProfile::None);

    REQUIRE(flag.TryLoadString("FALSE"));
    REQUIRE(!flag.GetValue());
    REQUIRE(!flag.TryLoadString("maybe"));
    REQUIRE(!flag.GetValue());

    REQUIRE(!number.TryLoadString("lots"));
    REQUIRE(!number.TryLoadString("99999999999999999999999"));
    REQUIRE(number.GetValue() == 7);

    // Going through the type-erased interface, as configuration loaders do.
    BasicSetting& erased = policy;
    REQUIRE(erased.TryLoadString("fail"));
    REQUIRE(policy.GetValue() == TypeIndexPolicy::Fail);
}

TEST_CASE("Settings: RestoreDefaults", "[common]") {
    values.show_raw = true;
    values.limits_profile = LimitsProfile::None;

    RestoreDefaults();
    REQUIRE(!values.show_raw.GetValue());
    REQUIRE(values.limits_profile.GetValue() == LimitsProfile::Sensible);
    REQUIRE(values.sort_transitions.GetValue());
    REQUIRE(values.log_filter.GetValue() == "*:Info");
}

} // namespace Settings
