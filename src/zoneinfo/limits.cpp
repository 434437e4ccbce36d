// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include "common/logging/log.h"
#include "zoneinfo/limits.h"

namespace Zoneinfo {

namespace {
Result CheckLimit(Structures structures, u32 requested, std::optional<u32> limit,
                  ErrorContext* out_context) {
    R_SUCCEED_IF(!limit.has_value() || requested <= *limit);

    LOG_ERROR(Tzif_Parser, "Too many {}: header requests {}, limit is {}", structures, requested,
              *limit);
    if (out_context) {
        out_context->limit_violation = LimitViolation{
            .structures = structures,
            .requested = requested,
            .limit = *limit,
        };
    }
    R_THROW(ResultLimitReached);
}
} // Anonymous namespace

Result Limits::Verify(const Header& header, ErrorContext* out_context) const {
    R_TRY(CheckLimit(Structures::Transitions, header.num_transitions, max_transitions,
                     out_context));
    R_TRY(CheckLimit(Structures::LocalTimeTypes, header.num_local_time_types,
                     max_local_time_types, out_context));
    R_TRY(CheckLimit(Structures::LeapSeconds, header.num_leap_seconds, max_leap_seconds,
                     out_context));
    R_TRY(CheckLimit(Structures::GMTFlags, header.num_gmt_flags, max_local_time_types,
                     out_context));
    R_TRY(CheckLimit(Structures::StandardFlags, header.num_standard_flags, max_local_time_types,
                     out_context));
    R_TRY(CheckLimit(Structures::TimezoneAbbrChars, header.num_abbr_chars,
                     max_abbreviation_chars, out_context));
    R_SUCCEED();
}

} // namespace Zoneinfo
