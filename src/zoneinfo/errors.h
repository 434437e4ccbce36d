// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

#include "common/common_types.h"
#include "zoneinfo/result.h"
#include "zoneinfo/tzif_types.h"

namespace Zoneinfo {

// Structural parser
constexpr Result ResultInvalidMagicNumber{ErrorModule::Tzif, 101};
constexpr Result ResultTruncated{ErrorModule::Tzif, 102};
constexpr Result ResultLimitReached{ErrorModule::Tzif, 103};

// Cooker
constexpr Result ResultInvalidText{ErrorModule::Tzif, 201};
constexpr Result ResultInvalidTypeIndex{ErrorModule::Tzif, 202};
constexpr Result ResultNoLocalTimeTypes{ErrorModule::Tzif, 203};

/// A header count that exceeded its configured maximum.
struct LimitViolation {
    Structures structures;
    u32 requested;
    u32 limit;

    bool operator==(const LimitViolation&) const = default;
};

/**
 * Details of the most recent failure, filled in by whichever stage failed. Only the fields
 * relevant to the returned Result are meaningful.
 */
struct ErrorContext {
    /// ResultInvalidMagicNumber: the bytes found where the signature was expected.
    std::array<u8, 4> magic{};
    std::size_t magic_size{};

    /// ResultTruncated: cursor position and the number of bytes the failed read needed.
    std::size_t offset{};
    std::size_t wanted{};

    /// ResultLimitReached
    std::optional<LimitViolation> limit_violation;

    /// ResultInvalidTypeIndex: position in the transition list and the index it held.
    /// ResultInvalidText: the local time type whose name failed validation.
    std::size_t transition_index{};
    std::size_t type_index{};
};

/// Renders a human-readable description of a failed decode.
[[nodiscard]] std::string FormatError(Result result, const ErrorContext& context);

} // namespace Zoneinfo
