// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <optional>

#include "common/common_types.h"
#include "zoneinfo/errors.h"
#include "zoneinfo/result.h"
#include "zoneinfo/tzif_types.h"

namespace Zoneinfo {

/**
 * Maximum numbers of structures that may be loaded from a single file.
 *
 * The header declares every section length as a 32-bit count, so a corrupt or crafted file can
 * ask for gigabytes of records. The counts are checked against these limits before anything
 * sized by them is allocated. An empty optional disables the corresponding check.
 */
struct Limits {
    std::optional<u32> max_transitions;
    /// Also caps both flag arrays, which hold one entry per local time type.
    std::optional<u32> max_local_time_types;
    std::optional<u32> max_abbreviation_chars;
    std::optional<u32> max_leap_seconds;

    /// No limits at all. Only suitable for trusted input.
    [[nodiscard]] static constexpr Limits None() {
        return {};
    }

    /// The limits of the reference tzcode implementation (TZ_MAX_TIMES and friends in tzfile.h).
    [[nodiscard]] static constexpr Limits Sensible() {
        return {
            .max_transitions = 2000,
            .max_local_time_types = 256,
            .max_abbreviation_chars = 50,
            .max_leap_seconds = 50,
        };
    }

    /**
     * Checks every header count against its limit, in the order transitions, local time types,
     * leap seconds, GMT flags, standard flags, abbreviation chars. The first count over its limit
     * is reported through `out_context` as a LimitViolation.
     */
    Result Verify(const Header& header, ErrorContext* out_context = nullptr) const;
};

} // namespace Zoneinfo
