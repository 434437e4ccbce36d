// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "common/common_types.h"
#include "zoneinfo/errors.h"
#include "zoneinfo/limits.h"
#include "zoneinfo/result.h"
#include "zoneinfo/tzif_types.h"

namespace Zoneinfo {

/**
 * Sequential reader over the v1 block of a TZif buffer. Every read advances a single cursor;
 * there is no seeking. Reads that would run past the end of the buffer fail with
 * ResultTruncated and leave the cursor where it was.
 */
class Parser {
public:
    explicit Parser(std::span<const u8> input, ErrorContext* out_context = nullptr);

    /// Reads the four byte signature, which must be "TZif".
    Result ReadMagic();

    /// Consumes the reserved area following the signature. Its contents are not checked.
    Result SkipReserved();

    Result ReadHeader(Header& out_header);

    /// Reads `count` timestamps followed by `count` type indices.
    Result ReadTransitions(std::vector<RawTransition>& out_transitions, u32 count);

    Result ReadLocalTimeTypes(std::vector<RawLocalTimeType>& out_types, u32 count);

    Result ReadLeapSeconds(std::vector<RawLeapSecond>& out_leap_seconds, u32 count);

    /// Reads `count` single bytes: the abbreviation pool and both flag arrays.
    Result ReadOctets(std::vector<u8>& out_octets, u32 count);

    [[nodiscard]] std::size_t Position() const {
        return m_offset;
    }

    [[nodiscard]] std::size_t Remaining() const {
        return m_input.size() - m_offset;
    }

private:
    Result Require(std::size_t size);
    u8 TakeU8();
    s32 TakeS32();
    u32 TakeU32();

    std::span<const u8> m_input;
    std::size_t m_offset{};
    ErrorContext* m_context;
};

/**
 * Parses the v1 block of a TZif file into raw records, without interpreting them.
 *
 * Header counts are checked against `limits` before any section is allocated. On failure
 * `out_data` is left untouched and, when given, `out_context` describes what went wrong.
 */
Result Parse(TZData& out_data, std::span<const u8> input, const Limits& limits,
             ErrorContext* out_context = nullptr);

} // namespace Zoneinfo
