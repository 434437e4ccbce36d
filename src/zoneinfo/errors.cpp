// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <span>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "zoneinfo/errors.h"

namespace Zoneinfo {

std::string FormatError(Result result, const ErrorContext& context) {
    if (result == ResultSuccess) {
        return "success";
    }
    if (result == ResultInvalidMagicNumber) {
        const std::span<const u8> magic{context.magic.data(), context.magic_size};
        return fmt::format("invalid magic number {:02X}", fmt::join(magic, " "));
    }
    if (result == ResultTruncated) {
        return fmt::format("unexpected end of data at offset {} (wanted {} bytes)",
                           context.offset, context.wanted);
    }
    if (result == ResultLimitReached) {
        if (!context.limit_violation) {
            return "limit reached";
        }
        const auto& violation = *context.limit_violation;
        return fmt::format("too many {} (tried to read {}, limit was {})", violation.structures,
                           violation.requested, violation.limit);
    }
    if (result == ResultInvalidText) {
        return fmt::format("name of local time type {} is not valid UTF-8", context.type_index);
    }
    if (result == ResultInvalidTypeIndex) {
        return fmt::format("transition {} refers to nonexistent local time type {}",
                           context.transition_index, context.type_index);
    }
    if (result == ResultNoLocalTimeTypes) {
        return "read 0 local time types";
    }
    return fmt::format("unknown error (module {}, description {})",
                       static_cast<u32>(result.GetModule()), result.GetDescription());
}

} // namespace Zoneinfo
