// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <algorithm>
#include <utility>

#include <fmt/ranges.h>

#include "common/logging/log.h"
#include "common/swap.h"
#include "zoneinfo/parser.h"

namespace Zoneinfo {

namespace {
constexpr std::size_t TransitionRecordSize = sizeof(s32) + sizeof(u8);
constexpr std::size_t LocalTimeTypeRecordSize = sizeof(s32) + 2 * sizeof(u8);
constexpr std::size_t LeapSecondRecordSize = 2 * sizeof(s32);

static_assert(TzifMagic.size() + ReservedSize + sizeof(u8) + 6 * sizeof(u32) == HeaderSize);
} // Anonymous namespace

Parser::Parser(std::span<const u8> input, ErrorContext* out_context)
    : m_input{input}, m_context{out_context} {}

Result Parser::Require(std::size_t size) {
    R_SUCCEED_IF(size <= Remaining());

    LOG_ERROR(Tzif_Parser, "Truncated input at offset {}: wanted {} bytes, {} available",
              m_offset, size, Remaining());
    if (m_context) {
        m_context->offset = m_offset;
        m_context->wanted = size;
    }
    R_THROW(ResultTruncated);
}

u8 Parser::TakeU8() {
    return m_input[m_offset++];
}

s32 Parser::TakeS32() {
    const s32 value = Common::LoadBigEndian<s32>(m_input.data() + m_offset);
    m_offset += sizeof(s32);
    return value;
}

u32 Parser::TakeU32() {
    const u32 value = Common::LoadBigEndian<u32>(m_input.data() + m_offset);
    m_offset += sizeof(u32);
    return value;
}

Result Parser::ReadMagic() {
    const std::size_t available = std::min(TzifMagic.size(), Remaining());
    const auto magic = m_input.subspan(m_offset, available);
    m_offset += available;

    if (available == TzifMagic.size() && std::ranges::equal(magic, TzifMagic)) {
        R_SUCCEED();
    }

    LOG_ERROR(Tzif_Parser, "Invalid magic number {:02X}", fmt::join(magic, " "));
    if (m_context) {
        std::ranges::copy(magic, m_context->magic.begin());
        m_context->magic_size = available;
    }
    R_THROW(ResultInvalidMagicNumber);
}

Result Parser::SkipReserved() {
    R_TRY(Require(ReservedSize));
    m_offset += ReservedSize;
    R_SUCCEED();
}

Result Parser::ReadHeader(Header& out_header) {
    R_TRY(Require(sizeof(u8) + 6 * sizeof(u32)));

    // Field order matches the file layout and must not be rearranged.
    out_header.version = TakeU8();
    out_header.num_gmt_flags = TakeU32();
    out_header.num_standard_flags = TakeU32();
    out_header.num_leap_seconds = TakeU32();
    out_header.num_transitions = TakeU32();
    out_header.num_local_time_types = TakeU32();
    out_header.num_abbr_chars = TakeU32();
    R_SUCCEED();
}

Result Parser::ReadTransitions(std::vector<RawTransition>& out_transitions, u32 count) {
    R_TRY(Require(static_cast<std::size_t>(count) * TransitionRecordSize));

    out_transitions.resize(count);
    for (auto& transition : out_transitions) {
        transition.timestamp = TakeS32();
    }
    for (auto& transition : out_transitions) {
        transition.local_time_type_index = TakeU8();
    }
    R_SUCCEED();
}

Result Parser::ReadLocalTimeTypes(std::vector<RawLocalTimeType>& out_types, u32 count) {
    R_TRY(Require(static_cast<std::size_t>(count) * LocalTimeTypeRecordSize));

    out_types.reserve(count);
    for (u32 i = 0; i < count; i++) {
        RawLocalTimeType type{};
        type.offset = TakeS32();
        type.is_dst = TakeU8();
        type.name_offset = TakeU8();
        out_types.push_back(type);
    }
    R_SUCCEED();
}

Result Parser::ReadLeapSeconds(std::vector<RawLeapSecond>& out_leap_seconds, u32 count) {
    R_TRY(Require(static_cast<std::size_t>(count) * LeapSecondRecordSize));

    out_leap_seconds.reserve(count);
    for (u32 i = 0; i < count; i++) {
        RawLeapSecond leap_second{};
        leap_second.timestamp = TakeS32();
        leap_second.leap_second_count = TakeS32();
        out_leap_seconds.push_back(leap_second);
    }
    R_SUCCEED();
}

Result Parser::ReadOctets(std::vector<u8>& out_octets, u32 count) {
    R_TRY(Require(count));

    const auto octets = m_input.subspan(m_offset, count);
    out_octets.assign(octets.begin(), octets.end());
    m_offset += count;
    R_SUCCEED();
}

Result Parse(TZData& out_data, std::span<const u8> input, const Limits& limits,
             ErrorContext* out_context) {
    Parser parser{input, out_context};
    TZData data{};

    R_TRY(parser.ReadMagic());
    R_TRY(parser.SkipReserved());
    R_TRY(parser.ReadHeader(data.header));

    const Header& header = data.header;
    LOG_DEBUG(Tzif_Parser,
              "version={:#04x} transitions={} types={} leap_seconds={} abbr_chars={} "
              "standard_flags={} gmt_flags={}",
              header.version, header.num_transitions, header.num_local_time_types,
              header.num_leap_seconds, header.num_abbr_chars, header.num_standard_flags,
              header.num_gmt_flags);
    if (!IsKnownVersion(header.version)) {
        LOG_WARNING(Tzif_Parser, "Unknown format version {:#04x}, reading as version 1",
                    header.version);
    }

    R_TRY(limits.Verify(header, out_context));

    R_TRY(parser.ReadTransitions(data.transitions, header.num_transitions));
    R_TRY(parser.ReadLocalTimeTypes(data.time_info, header.num_local_time_types));
    R_TRY(parser.ReadOctets(data.strings, header.num_abbr_chars));
    R_TRY(parser.ReadLeapSeconds(data.leap_seconds, header.num_leap_seconds));
    R_TRY(parser.ReadOctets(data.standard_flags, header.num_standard_flags));
    R_TRY(parser.ReadOctets(data.gmt_flags, header.num_gmt_flags));

    data.consumed_bytes = parser.Position();
    if (parser.Remaining() != 0) {
        LOG_DEBUG(Tzif_Parser, "Leaving {} trailing bytes unread", parser.Remaining());
    }

    out_data = std::move(data);
    R_SUCCEED();
}

} // namespace Zoneinfo
