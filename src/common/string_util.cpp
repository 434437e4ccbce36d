// SPDX-FileCopyrightText: 2013 Dolphin Emulator Project
// SPDX-FileCopyrightText: 2014 Citra Emulator Project
// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <algorithm>

#include "common/string_util.h"

namespace Common {

std::string StringFromBuffer(std::span<const u8> data) {
    return std::string(data.begin(), std::find(data.begin(), data.end(), '\0'));
}

bool IsValidUTF8(std::span<const u8> data) {
    std::size_t i = 0;
    while (i < data.size()) {
        const u8 lead = data[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t length{};
        u32 code_point{};
        u32 minimum{};
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
            minimum = 0x10000;
        } else {
            // Stray continuation byte or 0xF8..0xFF
            return false;
        }

        if (data.size() - i < length) {
            return false;
        }
        for (std::size_t j = 1; j < length; ++j) {
            const u8 continuation = data[i + j];
            if ((continuation & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (continuation & 0x3F);
        }

        if (code_point < minimum || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

std::span<const u8> SpanUntilNul(std::span<const u8> data, std::size_t offset) {
    if (offset >= data.size()) {
        return {};
    }
    const auto tail = data.subspan(offset);
    const auto nul = std::find(tail.begin(), tail.end(), u8{0});
    return tail.first(static_cast<std::size_t>(nul - tail.begin()));
}

} // namespace Common
