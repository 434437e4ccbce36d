// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <iterator>
#include <utility>

#include "common/logging/log.h"
#include "common/string_util.h"
#include "zoneinfo/cooker.h"

namespace Zoneinfo {

namespace {
Result CookLocalTimeTypes(std::vector<std::shared_ptr<const LocalTimeType>>& out_types,
                          const TZData& raw, ErrorContext* out_context) {
    if (raw.standard_flags.size() < raw.time_info.size() ||
        raw.gmt_flags.size() < raw.time_info.size()) {
        LOG_DEBUG(Tzif_Cooker,
                  "{} local time types but only {} standard and {} GMT flags, missing flags "
                  "read as false",
                  raw.time_info.size(), raw.standard_flags.size(), raw.gmt_flags.size());
    }

    out_types.reserve(raw.time_info.size());
    for (std::size_t i = 0; i < raw.time_info.size(); i++) {
        const RawLocalTimeType& info = raw.time_info[i];

        const auto name = ExtractName(raw.strings, info.name_offset);
        if (!Common::IsValidUTF8(name)) {
            LOG_ERROR(Tzif_Cooker, "Name of local time type {} at offset {} is not valid UTF-8",
                      i, info.name_offset);
            if (out_context) {
                out_context->type_index = i;
            }
            R_THROW(ResultInvalidText);
        }

        out_types.push_back(std::make_shared<const LocalTimeType>(LocalTimeType{
            .name = Common::StringFromBuffer(name),
            .offset = info.offset,
            .is_dst = info.is_dst != 0,
            .transition_type = FlagsToTransitionType(ReadFlag(raw.standard_flags, i),
                                                     ReadFlag(raw.gmt_flags, i)),
        }));
    }
    R_SUCCEED();
}

Result ResolveLocalTimeType(std::shared_ptr<const LocalTimeType>& out_type,
                            const std::vector<std::shared_ptr<const LocalTimeType>>& types,
                            std::size_t transition_index, u8 type_index, TypeIndexPolicy policy,
                            ErrorContext* out_context) {
    if (type_index < types.size()) {
        out_type = types[type_index];
        R_SUCCEED();
    }

    if (policy == TypeIndexPolicy::ClampToFirst) {
        R_UNLESS(!types.empty(), ResultNoLocalTimeTypes);
        LOG_WARNING(Tzif_Cooker, "Transition {} refers to local time type {} of {}, using type 0",
                    transition_index, type_index, types.size());
        out_type = types.front();
        R_SUCCEED();
    }

    LOG_ERROR(Tzif_Cooker, "Transition {} refers to local time type {}, only {} exist",
              transition_index, type_index, types.size());
    if (out_context) {
        out_context->transition_index = transition_index;
        out_context->type_index = type_index;
    }
    R_THROW(ResultInvalidTypeIndex);
}
} // Anonymous namespace

std::span<const u8> ExtractName(std::span<const u8> strings, u8 name_offset) {
    return Common::SpanUntilNul(strings, name_offset);
}

Result Cook(TimeZoneData& out_data, const TZData& raw, TypeIndexPolicy policy,
            ErrorContext* out_context) {
    TimeZoneData data{};
    data.version = raw.header.version;

    // First, build up the list of local time types...
    R_TRY(CookLocalTimeTypes(data.local_time_types, raw, out_context));

    // ...then link each transition with the type it refers to.
    std::vector<Transition> transitions;
    transitions.reserve(raw.transitions.size());
    for (std::size_t i = 0; i < raw.transitions.size(); i++) {
        const RawTransition& transition = raw.transitions[i];

        std::shared_ptr<const LocalTimeType> type;
        R_TRY(ResolveLocalTimeType(type, data.local_time_types, i,
                                   transition.local_time_type_index, policy, out_context));
        transitions.push_back({
            .timestamp = transition.timestamp,
            .local_time_type = std::move(type),
        });
    }

    data.leap_seconds.reserve(raw.leap_seconds.size());
    for (const auto& leap_second : raw.leap_seconds) {
        data.leap_seconds.push_back({
            .timestamp = leap_second.timestamp,
            .leap_second_count = static_cast<u32>(leap_second.leap_second_count),
        });
    }

    if (transitions.empty()) {
        if (data.local_time_types.empty()) {
            LOG_ERROR(Tzif_Cooker, "No transitions and no local time types to use as base");
            R_THROW(ResultNoLocalTimeTypes);
        }
        data.base = data.local_time_types.front();
    } else {
        data.base = std::move(transitions.front().local_time_type);
        data.transitions.assign(std::make_move_iterator(transitions.begin() + 1),
                                std::make_move_iterator(transitions.end()));
    }

    LOG_DEBUG(Tzif_Cooker, "Cooked {} local time types, {} transitions, {} leap seconds, base {}",
              data.local_time_types.size(), data.transitions.size(), data.leap_seconds.size(),
              data.base->name);

    out_data = std::move(data);
    R_SUCCEED();
}

} // namespace Zoneinfo
