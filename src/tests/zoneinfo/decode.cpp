// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "common/logging/backend.h"
#include "tests/zoneinfo/sample_data.h"
#include "zoneinfo/decode.h"

namespace Zoneinfo {

using namespace Tests;

TEST_CASE("Decode: EST", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    TimeZoneData zone{};
    REQUIRE(Decode(zone, EstZone) == ResultSuccess);

    REQUIRE(!zone.name.has_value());
    REQUIRE(zone.version == 0);
    REQUIRE(*zone.base == LocalTimeType{.name = "EST",
                                        .offset = -18000,
                                        .is_dst = false,
                                        .transition_type = TransitionType::Wall});
    REQUIRE(zone.transitions.empty());
    REQUIRE(zone.leap_seconds.empty());
}

TEST_CASE("Decode: Japan", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    TimeZoneData zone{};
    REQUIRE(Decode(zone, JapanZone) == ResultSuccess);

    REQUIRE(zone.base->name == "JST");
    REQUIRE(zone.transitions.size() == 8);
    REQUIRE(zone.transitions.front().timestamp == -683794800);
    REQUIRE(zone.transitions.front().local_time_type->name == "JDT");
    REQUIRE(zone.transitions.back().timestamp == -578044800);
    REQUIRE(zone.transitions.back().local_time_type->name == "JST");
}

TEST_CASE("Decode: Leap seconds and flags", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    TimeZoneData zone{};
    REQUIRE(Decode(zone, LeapZone) == ResultSuccess);

    REQUIRE(zone.version == '2');
    REQUIRE(*zone.base == LocalTimeType{.name = "UTC",
                                        .offset = 0,
                                        .is_dst = false,
                                        .transition_type = TransitionType::Standard});
    REQUIRE(zone.transitions.size() == 1);
    REQUIRE(zone.transitions[0].timestamp == 200000);
    REQUIRE(*zone.transitions[0].local_time_type ==
            LocalTimeType{.name = "BST",
                          .offset = 3600,
                          .is_dst = true,
                          .transition_type = TransitionType::UTC});
    REQUIRE(zone.leap_seconds == std::vector<LeapSecond>{
                                     {.timestamp = 78796800, .leap_second_count = 1},
                                     {.timestamp = 94694401, .leap_second_count = 2},
                                 });
}

TEST_CASE("Decode: Limits", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    const auto input = MakeHeader(0, 0, 0, 5000, 1, 4);

    TimeZoneData zone{};
    ErrorContext context{};
    REQUIRE(Decode(zone, input, &context) == ResultLimitReached);
    REQUIRE(FormatError(ResultLimitReached, context) ==
            "too many transitions (tried to read 5000, limit was 2000)");

    REQUIRE(Decode(zone, input, Limits::None(), TypeIndexPolicy::Fail, &context) ==
            ResultTruncated);
    REQUIRE(zone.base == nullptr);
}

TEST_CASE("Decode: Type index policy", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    std::vector<u8> input = JapanZone;
    // Point the last transition at a type that does not exist.
    input[HeaderSize + 9 * 4 + 8] = 0x05;

    TimeZoneData zone{};
    ErrorContext context{};
    REQUIRE(Decode(zone, input, &context) == ResultInvalidTypeIndex);
    REQUIRE(FormatError(ResultInvalidTypeIndex, context) ==
            "transition 8 refers to nonexistent local time type 5");

    REQUIRE(Decode(zone, input, Limits::Sensible(), TypeIndexPolicy::ClampToFirst, &context) ==
            ResultSuccess);
    REQUIRE(zone.transitions.back().local_time_type->name == "JCST");
}

TEST_CASE("Decode: Error messages", "[zoneinfo]") {
    Common::Log::DisableLoggingInTests();

    TimeZoneData zone{};
    ErrorContext context{};

    const std::vector<u8> not_tzif{'R', 'I', 'F', 'F', 0, 0};
    REQUIRE(Decode(zone, not_tzif, &context) == ResultInvalidMagicNumber);
    REQUIRE(FormatError(ResultInvalidMagicNumber, context) == "invalid magic number 52 49 46 46");

    const std::vector<u8> truncated(EstZone.begin(), EstZone.begin() + 48);
    REQUIRE(Decode(zone, truncated, &context) == ResultTruncated);
    REQUIRE(FormatError(ResultTruncated, context) ==
            "unexpected end of data at offset 44 (wanted 6 bytes)");

    REQUIRE(FormatError(ResultSuccess, context) == "success");
}

} // namespace Zoneinfo
