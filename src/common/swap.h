// SPDX-FileCopyrightText: 2012 PPSSPP Project
// SPDX-FileCopyrightText: 2012 Dolphin Emulator Project
// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <bit>
#include <cstring>
#include <type_traits>

#if defined(_MSC_VER)
#include <cstdlib>
#endif
#include "common/common_types.h"

namespace Common {

#ifdef _MSC_VER
[[nodiscard]] inline u16 swap16(u16 data) noexcept {
    return _byteswap_ushort(data);
}
[[nodiscard]] inline u32 swap32(u32 data) noexcept {
    return _byteswap_ulong(data);
}
#else
// GCC and Clang both provide these builtins
[[nodiscard]] constexpr u16 swap16(u16 data) noexcept {
    return __builtin_bswap16(data);
}
[[nodiscard]] constexpr u32 swap32(u32 data) noexcept {
    return __builtin_bswap32(data);
}
#endif

/**
 * Loads a big-endian value of type T from the start of the given byte pointer, which must
 * reference at least sizeof(T) readable bytes. No alignment is required.
 */
template <typename T>
    requires(std::is_integral_v<T> && (sizeof(T) == 2 || sizeof(T) == 4))
[[nodiscard]] T LoadBigEndian(const u8* data) noexcept {
    using Unsigned = std::make_unsigned_t<T>;
    Unsigned value{};
    std::memcpy(&value, data, sizeof(T));
    if constexpr (std::endian::native == std::endian::little) {
        if constexpr (sizeof(T) == 2) {
            value = swap16(value);
        } else {
            value = swap32(value);
        }
    }
    return static_cast<T>(value);
}

} // namespace Common
