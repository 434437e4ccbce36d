// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "common/common_types.h"
#include "zoneinfo/errors.h"
#include "zoneinfo/result.h"
#include "zoneinfo/tzif_types.h"

namespace Zoneinfo {

/// How the transition instants of a local time type were specified in the source rules.
enum class TransitionType : u8 {
    Standard, ///< Local standard time
    Wall,     ///< Local wall clock time
    UTC,      ///< Universal time
};

/**
 * Combines the two flags stored for a local time type. A set UTC flag wins over the standard
 * flag, and a type with neither set is wall clock time.
 */
[[nodiscard]] constexpr TransitionType FlagsToTransitionType(bool standard, bool gmt) {
    if (gmt) {
        return TransitionType::UTC;
    }
    return standard ? TransitionType::Standard : TransitionType::Wall;
}

/**
 * Reads entry `index` of a flag array. Files may carry fewer flags than local time types; any
 * index past the end of the array reads as false rather than failing.
 */
[[nodiscard]] constexpr bool ReadFlag(std::span<const u8> flags, std::size_t index) {
    return index < flags.size() && flags[index] != 0;
}

/**
 * Returns the abbreviation starting at `name_offset` in the pool, up to the next NUL byte or the
 * end of the pool, whichever comes first. Bytes after the terminator never affect the result.
 */
[[nodiscard]] std::span<const u8> ExtractName(std::span<const u8> strings, u8 name_offset);

/// Decides what happens to a transition whose type index has no local time type.
enum class TypeIndexPolicy : u8 {
    Fail,         ///< Reject the file with ResultInvalidTypeIndex
    ClampToFirst, ///< Use local time type 0 instead
};

/// A period during which the clocks do not change.
struct LocalTimeType {
    std::string name; ///< Abbreviation such as "GMT" or "JST"
    s64 offset;       ///< Seconds added to UTC
    bool is_dst;
    TransitionType transition_type;

    bool operator==(const LocalTimeType&) const = default;
};

struct Transition {
    s64 timestamp; ///< Instant the type below takes effect, seconds since the epoch
    std::shared_ptr<const LocalTimeType> local_time_type;
};

struct LeapSecond {
    s32 timestamp;         ///< Instant at which the correction takes effect
    u32 leap_second_count; ///< Total correction from then on

    bool operator==(const LeapSecond&) const = default;
};

/**
 * The interpreted contents of a zoneinfo file.
 *
 * `base` is in effect for every instant before the first entry of `transitions`. It comes from
 * the first transition recorded in the file, whose own timestamp is dropped, or from local time
 * type 0 when the file records no transitions at all.
 */
struct TimeZoneData {
    /// Zone identifier, when the caller knows one. Never set by Cook.
    std::optional<std::string> name;
    u8 version{};

    std::shared_ptr<const LocalTimeType> base;
    std::vector<Transition> transitions;

    /// Every local time type in file order. Transitions share these objects.
    std::vector<std::shared_ptr<const LocalTimeType>> local_time_types;
    std::vector<LeapSecond> leap_seconds;
};

/**
 * Resolves raw records into a TimeZoneData. On failure `out_data` is left untouched.
 */
Result Cook(TimeZoneData& out_data, const TZData& raw,
            TypeIndexPolicy policy = TypeIndexPolicy::Fail, ErrorContext* out_context = nullptr);

} // namespace Zoneinfo

template <>
struct fmt::formatter<Zoneinfo::TransitionType> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext>
    auto format(Zoneinfo::TransitionType type, FormatContext& ctx) const {
        fmt::string_view name = "Unknown";
        switch (type) {
        case Zoneinfo::TransitionType::Standard:
            name = "Standard";
            break;
        case Zoneinfo::TransitionType::Wall:
            name = "Wall";
            break;
        case Zoneinfo::TransitionType::UTC:
            name = "UTC";
            break;
        }
        return fmt::formatter<fmt::string_view>::format(name, ctx);
    }
};
