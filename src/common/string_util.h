// SPDX-FileCopyrightText: 2013 Dolphin Emulator Project
// SPDX-FileCopyrightText: 2014 Citra Emulator Project
// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include "common/common_types.h"

namespace Common {

[[nodiscard]] std::string StringFromBuffer(std::span<const u8> data);

/**
 * Checks that `data` is well-formed UTF-8: no overlong encodings, no surrogate code points, no
 * code points above U+10FFFF and no truncated sequences.
 */
[[nodiscard]] bool IsValidUTF8(std::span<const u8> data);

/**
 * Returns the bytes from `offset` up to, but not including, the first NUL byte. If no NUL byte
 * follows `offset` the remainder of the buffer is returned, and an `offset` at or past the end
 * yields an empty span.
 */
[[nodiscard]] std::span<const u8> SpanUntilNul(std::span<const u8> data, std::size_t offset);

/**
 * Compares the string defined by the range [`begin`, `end`) to the null-terminated C-string
 * `other` for equality.
 */
template <typename InIt>
[[nodiscard]] bool ComparePartialString(InIt begin, InIt end, const char* other) {
    for (; begin != end && *other != '\0'; ++begin, ++other) {
        if (*begin != *other) {
            return false;
        }
    }
    // Only return true if both strings finished at the same point
    return (begin == end) == (*other == '\0');
}

} // namespace Common
