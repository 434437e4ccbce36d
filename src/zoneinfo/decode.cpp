// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include "common/logging/log.h"
#include "zoneinfo/decode.h"

namespace Zoneinfo {

Result Decode(TimeZoneData& out_data, std::span<const u8> input, ErrorContext* out_context) {
    R_RETURN(Decode(out_data, input, Limits::Sensible(), TypeIndexPolicy::Fail, out_context));
}

Result Decode(TimeZoneData& out_data, std::span<const u8> input, const Limits& limits,
              TypeIndexPolicy policy, ErrorContext* out_context) {
    ON_RESULT_FAILURE {
        LOG_DEBUG(Tzif, "Failed to decode {} byte buffer", input.size());
    };

    TZData raw{};
    R_TRY(Parse(raw, input, limits, out_context));
    R_TRY(Cook(out_data, raw, policy, out_context));
    R_SUCCEED();
}

} // namespace Zoneinfo
