// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "common/logging/backend.h"
#include "common/string_util.h"
#include "tests/zoneinfo/sample_data.h"
#include "zoneinfo/cooker.h"
#include "zoneinfo/parser.h"

namespace Zoneinfo {

using namespace Tests;

namespace {
/// Two types, "AAA" and "BBB", with transitions referring to them by the given indices.
TZData MakeRaw(std::vector<u8> indices) {
    TZData raw{};
    raw.header.num_transitions = static_cast<u32>(indices.size());
    raw.header.num_local_time_types = 2;
    raw.header.num_abbr_chars = 8;
    raw.time_info = {
        {.offset = 3600, .is_dst = 0, .name_offset = 0},
        {.offset = 7200, .is_dst = 1, .name_offset = 4},
    };
    raw.strings = {'A', 'A', 'A', '\0', 'B', 'B', 'B', '\0'};
    for (std::size_t i = 0; i < indices.size(); i++) {
        raw.transitions.push_back({
            .timestamp = static_cast<s32>(1000 * i),
            .local_time_type_index = indices[i],
        });
    }
    return raw;
}
} // Anonymous namespace

TEST_CASE("Cooker: Transition type precedence", "[zoneinfo]") {
    STATIC_REQUIRE(FlagsToTransitionType(false, false) == TransitionType::Wall);
    STATIC_REQUIRE(FlagsToTransitionType(true, false) == TransitionType::Standard);
    STATIC_REQUIRE(FlagsToTransitionType(false, true) == TransitionType::UTC);
    STATIC_REQUIRE(FlagsToTransitionType(true, true) == TransitionType::UTC);
}

TEST_CASE("Cooker: Missing flags read as false", "[zoneinfo]") {
    const std::vector<u8> flags{1, 0};
    REQUIRE(ReadFlag(flags, 0));
    REQUIRE(!ReadFlag(flags, 1));
    REQUIRE(!ReadFlag(flags, 2));
    REQUIRE(!ReadFlag({}, 0));

    Common::Log::DisableLoggingInTests();

    TZData raw = MakeRaw({0, 1});
    raw.standard_flags = {1};
    raw.gmt_flags = {};

    TimeZoneData zone{};
    REQUIRE(Cook(zone, raw) == ResultSuccess);
    REQUIRE(zone.local_time_types[0]->transition_type == TransitionType::Standard);
    REQUIRE(zone.local_time_types[1]->transition_type == TransitionType::Wall);
}

TEST_CASE("Cooker: Name extraction", "[zoneinfo]") {
    const std::vector<u8> strings{'J', 'C', 'S', 'T', '\0', 'J', 'D', 'T', '\0', 'J', 'S', 'T'};

    REQUIRE(Common::StringFromBuffer(ExtractName(strings, 0)) == "JCST");
    REQUIRE(Common::StringFromBuffer(ExtractName(strings, 5)) == "JDT");
    REQUIRE(Common::StringFromBuffer(ExtractName(strings, 2)) == "ST");
    // Without a terminator the name runs to the end of the pool.
    REQUIRE(Common::StringFromBuffer(ExtractName(strings, 9)) == "JST");
    REQUIRE(ExtractName(strings, 4).empty());
    REQUIRE(ExtractName(strings, 200).empty());

    // Bytes after the terminator have no influence.
    std::vector<u8> altered = strings;
    altered[6] = 'X';
    REQUIRE(Common::StringFromBuffer(ExtractName(altered, 0)) == "JCST");
}

TEST_CASE("Cooker: Base regime is split off", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    const TZData raw = MakeRaw({1, 0, 1, 0});

    TimeZoneData zone{};
    REQUIRE(Cook(zone, raw) == ResultSuccess);

    REQUIRE(zone.base->name == "BBB");
    REQUIRE(zone.transitions.size() == raw.transitions.size() - 1);
    for (std::size_t i = 0; i < zone.transitions.size(); i++) {
        REQUIRE(zone.transitions[i].timestamp == raw.transitions[i + 1].timestamp);
    }
    REQUIRE(zone.transitions[0].local_time_type->name == "AAA");
    REQUIRE(zone.transitions[1].local_time_type->name == "BBB");
    REQUIRE(zone.transitions[2].local_time_type->name == "AAA");
}

TEST_CASE("Cooker: Local time types are shared", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    TimeZoneData zone{};
    REQUIRE(Cook(zone, MakeRaw({0, 1, 0, 1})) == ResultSuccess);

    REQUIRE(zone.local_time_types.size() == 2);
    REQUIRE(zone.base.get() == zone.local_time_types[0].get());
    REQUIRE(zone.transitions[0].local_time_type.get() == zone.local_time_types[1].get());
    REQUIRE(zone.transitions[1].local_time_type.get() == zone.base.get());
    REQUIRE(zone.transitions[0].local_time_type.get() ==
            zone.transitions[2].local_time_type.get());
}

TEST_CASE("Cooker: No transitions", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    TimeZoneData zone{};

    SECTION("the first local time type becomes the base") {
        REQUIRE(Cook(zone, MakeRaw({})) == ResultSuccess);
        REQUIRE(zone.base->name == "AAA");
        REQUIRE(zone.base->offset == 3600);
        REQUIRE(zone.transitions.empty());
    }

    SECTION("an empty catalog is rejected") {
        TZData raw{};
        ErrorContext context{};
        REQUIRE(Cook(zone, raw, TypeIndexPolicy::Fail, &context) == ResultNoLocalTimeTypes);
        REQUIRE(FormatError(ResultNoLocalTimeTypes, context) == "read 0 local time types");
        REQUIRE(zone.base == nullptr);
    }
}

TEST_CASE("Cooker: Out of range type index", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    const TZData raw = MakeRaw({0, 1, 7, 0});

    TimeZoneData zone{};
    ErrorContext context{};

    SECTION("fails by default") {
        REQUIRE(Cook(zone, raw, TypeIndexPolicy::Fail, &context) == ResultInvalidTypeIndex);
        REQUIRE(context.transition_index == 2);
        REQUIRE(context.type_index == 7);
        REQUIRE(zone.base == nullptr);
    }

    SECTION("can be clamped to the first type") {
        REQUIRE(Cook(zone, raw, TypeIndexPolicy::ClampToFirst, &context) == ResultSuccess);
        REQUIRE(zone.transitions[1].local_time_type.get() == zone.local_time_types[0].get());
    }

    SECTION("clamping with no types still fails") {
        TZData empty_types = raw;
        empty_types.time_info.clear();
        REQUIRE(Cook(zone, empty_types, TypeIndexPolicy::ClampToFirst, &context) ==
                ResultNoLocalTimeTypes);
    }
}

TEST_CASE("Cooker: Names must be valid UTF-8", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    TZData raw = MakeRaw({0});
    raw.strings[5] = 0xFF;

    TimeZoneData zone{};
    ErrorContext context{};
    REQUIRE(Cook(zone, raw, TypeIndexPolicy::Fail, &context) == ResultInvalidText);
    REQUIRE(context.type_index == 1);

    // Non-ASCII text is fine as long as it is well formed.
    raw.strings = {0xC3, 0xA9, '\0', 'B', 'B', '\0'};
    raw.time_info[1].name_offset = 3;
    REQUIRE(Cook(zone, raw) == ResultSuccess);
    REQUIRE(zone.local_time_types[0]->name == "\xC3\xA9");
}

TEST_CASE("Cooker: Leap seconds carry over", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    TZData raw = MakeRaw({0});
    raw.leap_seconds = {
        {.timestamp = 78796800, .leap_second_count = 1},
        {.timestamp = 94694401, .leap_second_count = 2},
    };

    TimeZoneData zone{};
    REQUIRE(Cook(zone, raw) == ResultSuccess);
    REQUIRE(zone.leap_seconds == std::vector<LeapSecond>{
                                     {.timestamp = 78796800, .leap_second_count = 1},
                                     {.timestamp = 94694401, .leap_second_count = 2},
                                 });
}

TEST_CASE("Cooker: Japan", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    TZData raw{};
    REQUIRE(Parse(raw, JapanZone, Limits::Sensible()) == ResultSuccess);

    TimeZoneData zone{};
    REQUIRE(Cook(zone, raw) == ResultSuccess);

    REQUIRE(zone.local_time_types.size() == 3);
    REQUIRE(*zone.local_time_types[0] == LocalTimeType{.name = "JCST",
                                                       .offset = 32400,
                                                       .is_dst = false,
                                                       .transition_type = TransitionType::Wall});
    REQUIRE(*zone.base == LocalTimeType{.name = "JST",
                                        .offset = 32400,
                                        .is_dst = false,
                                        .transition_type = TransitionType::Wall});
    REQUIRE(zone.transitions.size() == 8);
    for (std::size_t i = 0; i < zone.transitions.size(); i++) {
        const auto& transition = zone.transitions[i];
        REQUIRE(transition.timestamp == JapanTimestamps[i + 1]);
        if (i % 2 == 0) {
            REQUIRE(transition.local_time_type->name == "JDT");
            REQUIRE(transition.local_time_type->offset == 36000);
            REQUIRE(transition.local_time_type->is_dst);
        } else {
            REQUIRE(transition.local_time_type.get() == zone.base.get());
        }
    }
}

} // namespace Zoneinfo
