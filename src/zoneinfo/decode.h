// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <span>

#include "common/common_types.h"
#include "zoneinfo/cooker.h"
#include "zoneinfo/errors.h"
#include "zoneinfo/limits.h"
#include "zoneinfo/parser.h"
#include "zoneinfo/result.h"

namespace Zoneinfo {

/**
 * Parses and cooks a TZif buffer in one go, with Limits::Sensible() and TypeIndexPolicy::Fail.
 */
Result Decode(TimeZoneData& out_data, std::span<const u8> input,
              ErrorContext* out_context = nullptr);

/// As Decode, with caller-chosen limits and type index policy.
Result Decode(TimeZoneData& out_data, std::span<const u8> input, const Limits& limits,
              TypeIndexPolicy policy, ErrorContext* out_context = nullptr);

} // namespace Zoneinfo
