// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include <fmt/format.h>

#include "common/common_types.h"

namespace Zoneinfo {

/// Size in bytes of the v1 header, magic included.
constexpr std::size_t HeaderSize = 0x2C;

constexpr std::array<u8, 4> TzifMagic{'T', 'Z', 'i', 'f'};
constexpr std::size_t ReservedSize = 15;

/// Format generation stored in the byte following the reserved area.
enum class Version : u8 {
    V1 = '\0',
    V2 = '2',
    V3 = '3',
    V4 = '4',
};

[[nodiscard]] constexpr bool IsKnownVersion(u8 version) {
    switch (static_cast<Version>(version)) {
    case Version::V1:
    case Version::V2:
    case Version::V3:
    case Version::V4:
        return true;
    }
    return false;
}

/// Counts from the fixed-layout header, in on-disk field order.
struct Header {
    u8 version;
    u32 num_gmt_flags;        ///< tzh_ttisutcnt
    u32 num_standard_flags;   ///< tzh_ttisstdcnt
    u32 num_leap_seconds;     ///< tzh_leapcnt
    u32 num_transitions;      ///< tzh_timecnt
    u32 num_local_time_types; ///< tzh_typecnt
    u32 num_abbr_chars;       ///< tzh_charcnt

    bool operator==(const Header&) const = default;
};

struct RawTransition {
    s32 timestamp;            ///< Seconds since the epoch at which the rules change
    u8 local_time_type_index; ///< Index into TZData::time_info, not validated by the parser

    bool operator==(const RawTransition&) const = default;
};

struct RawLocalTimeType {
    s32 offset;     ///< tt_utoff, seconds added to UTC
    u8 is_dst;      ///< tt_isdst
    u8 name_offset; ///< tt_desigidx, start of the NUL-terminated name in TZData::strings

    bool operator==(const RawLocalTimeType&) const = default;
};

struct RawLeapSecond {
    s32 timestamp;
    s32 leap_second_count; ///< Total correction in effect from `timestamp` onward

    bool operator==(const RawLeapSecond&) const = default;
};

/**
 * The v1 block of a TZif file, read but not interpreted. Every vector holds exactly the number
 * of records the header announces.
 */
struct TZData {
    Header header{};
    std::vector<RawTransition> transitions;
    std::vector<RawLocalTimeType> time_info;
    std::vector<RawLeapSecond> leap_seconds;
    std::vector<u8> strings;
    std::vector<u8> standard_flags;
    std::vector<u8> gmt_flags;

    /// Number of input bytes the v1 block occupied. Anything after it (the 64-bit data block and
    /// footer of v2+ files) is left unread.
    std::size_t consumed_bytes{};
};

/// Names the header count being checked, for limit violations.
enum class Structures : u8 {
    Transitions,
    LocalTimeTypes,
    LeapSeconds,
    GMTFlags,
    StandardFlags,
    TimezoneAbbrChars,
};

} // namespace Zoneinfo

template <>
struct fmt::formatter<Zoneinfo::Structures> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext>
    auto format(Zoneinfo::Structures structures, FormatContext& ctx) const {
        fmt::string_view name = "unknown";
        switch (structures) {
        case Zoneinfo::Structures::Transitions:
            name = "transitions";
            break;
        case Zoneinfo::Structures::LocalTimeTypes:
            name = "local time types";
            break;
        case Zoneinfo::Structures::LeapSeconds:
            name = "leap seconds";
            break;
        case Zoneinfo::Structures::GMTFlags:
            name = "GMT flags";
            break;
        case Zoneinfo::Structures::StandardFlags:
            name = "Standard Time flags";
            break;
        case Zoneinfo::Structures::TimezoneAbbrChars:
            name = "timezone abbreviation chars";
            break;
        }
        return fmt::formatter<fmt::string_view>::format(name, ctx);
    }
};
