// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "common/common_types.h"
#include "common/logging/backend.h"
#include "common/logging/log.h"
#include "common/scm_rev.h"
#include "common/settings.h"
#include "tzdump/tzdump_config.h"
#include "zoneinfo/cooker.h"
#include "zoneinfo/errors.h"
#include "zoneinfo/limits.h"
#include "zoneinfo/parser.h"
#include "zoneinfo/result.h"

#undef _UNICODE
#include <getopt.h>

namespace {

constexpr Result ResultPathNotFound{ErrorModule::FS, 1};
constexpr Result ResultReadFailed{ErrorModule::FS, 2};

void PrintHelp(const char* argv0) {
    std::cout << "Usage: " << argv0
              << " [options] <file>...\n"
                 "-c, --config          Load the specified configuration file\n"
                 "-h, --help            Display this help and exit\n"
                 "-l, --limits          Limit profile for header counts: sensible or none\n"
                 "-p, --policy          Out of range type indices: fail or clamptofirst\n"
                 "-r, --raw             Print the raw records instead of the decoded zone\n"
                 "-s, --no-sort         Print transitions in file order\n"
                 "-v, --version         Output version information and exit\n";
}

void PrintVersion() {
    std::cout << "tzdump " << Common::g_build_version << " " << Common::g_scm_branch << " "
              << Common::g_scm_desc << std::endl;
}

Result ReadZoneFile(std::vector<u8>& out_buffer, const std::filesystem::path& path) {
    std::error_code ec;
    R_UNLESS(std::filesystem::is_regular_file(path, ec), ResultPathNotFound);

    std::ifstream file{path, std::ios::binary};
    R_UNLESS(file.is_open(), ResultReadFailed);

    out_buffer.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    R_UNLESS(!file.bad(), ResultReadFailed);
    R_SUCCEED();
}

Zoneinfo::Limits ToLimits(Settings::LimitsProfile profile) {
    switch (profile) {
    case Settings::LimitsProfile::None:
        return Zoneinfo::Limits::None();
    case Settings::LimitsProfile::Sensible:
        break;
    }
    return Zoneinfo::Limits::Sensible();
}

Zoneinfo::TypeIndexPolicy ToTypeIndexPolicy(Settings::TypeIndexPolicy policy) {
    switch (policy) {
    case Settings::TypeIndexPolicy::ClampToFirst:
        return Zoneinfo::TypeIndexPolicy::ClampToFirst;
    case Settings::TypeIndexPolicy::Fail:
        break;
    }
    return Zoneinfo::TypeIndexPolicy::Fail;
}

void PrintLocalTimeType(std::string_view label, const Zoneinfo::LocalTimeType& type) {
    fmt::print("{:>11}: name:{:5} offset:{:6} DST:{:5} type:{}\n", label, type.name, type.offset,
               type.is_dst, type.transition_type);
}

void DumpRaw(const Zoneinfo::TZData& raw) {
    const auto& header = raw.header;
    fmt::print("version: {:#04x}\n", header.version);
    fmt::print("counts: transitions={} types={} leap_seconds={} abbr_chars={} standard_flags={} "
               "gmt_flags={}\n",
               header.num_transitions, header.num_local_time_types, header.num_leap_seconds,
               header.num_abbr_chars, header.num_standard_flags, header.num_gmt_flags);
    for (const auto& transition : raw.transitions) {
        fmt::print("transition {:>11}: type {}\n", transition.timestamp,
                   transition.local_time_type_index);
    }
    for (std::size_t i = 0; i < raw.time_info.size(); i++) {
        const auto& info = raw.time_info[i];
        fmt::print("type {}: offset:{} is_dst:{} name_offset:{}\n", i, info.offset, info.is_dst,
                   info.name_offset);
    }
    for (const auto& leap_second : raw.leap_seconds) {
        fmt::print("leap second {:>11}: {}\n", leap_second.timestamp,
                   leap_second.leap_second_count);
    }
    fmt::print("consumed {} bytes\n", raw.consumed_bytes);
}

void DumpZone(const Zoneinfo::TimeZoneData& zone, bool sort_transitions) {
    fmt::print("{} (version {:#04x})\n", zone.name.value_or("<unnamed>"), zone.version);
    PrintLocalTimeType("base", *zone.base);

    std::vector<const Zoneinfo::Transition*> transitions;
    transitions.reserve(zone.transitions.size());
    for (const auto& transition : zone.transitions) {
        transitions.push_back(&transition);
    }
    if (sort_transitions) {
        std::ranges::stable_sort(transitions, {}, &Zoneinfo::Transition::timestamp);
    }
    for (const auto* transition : transitions) {
        PrintLocalTimeType(std::to_string(transition->timestamp), *transition->local_time_type);
    }

    for (const auto& leap_second : zone.leap_seconds) {
        fmt::print("leap second {:>11}: {}\n", leap_second.timestamp,
                   leap_second.leap_second_count);
    }
}

bool DumpFile(const std::string& path) {
    std::vector<u8> contents;
    if (const Result rc = ReadZoneFile(contents, path); R_FAILED(rc)) {
        if (rc == ResultPathNotFound) {
            LOG_ERROR(Frontend, "{}: no such file", path);
        } else {
            LOG_ERROR(Frontend, "{}: read failed", path);
        }
        return false;
    }

    const auto limits = ToLimits(Settings::values.limits_profile.GetValue());
    Zoneinfo::ErrorContext context{};

    Zoneinfo::TZData raw{};
    if (const Result rc = Zoneinfo::Parse(raw, contents, limits, &context); R_FAILED(rc)) {
        LOG_ERROR(Frontend, "{}: {}", path, Zoneinfo::FormatError(rc, context));
        return false;
    }

    if (Settings::values.show_raw.GetValue()) {
        DumpRaw(raw);
        return true;
    }

    Zoneinfo::TimeZoneData zone{};
    const auto policy = ToTypeIndexPolicy(Settings::values.type_index_policy.GetValue());
    if (const Result rc = Zoneinfo::Cook(zone, raw, policy, &context); R_FAILED(rc)) {
        LOG_ERROR(Frontend, "{}: {}", path, Zoneinfo::FormatError(rc, context));
        return false;
    }
    zone.name = path;

    DumpZone(zone, Settings::values.sort_transitions.GetValue());
    return true;
}

} // Anonymous namespace

int main(int argc, char** argv) {
    std::optional<std::string> config_path;
    std::optional<std::string> limits_override;
    std::optional<std::string> policy_override;
    bool raw_override = false;
    bool no_sort_override = false;

    static struct option long_options[] = {
        // clang-format off
        {"config", required_argument, 0, 'c'},
        {"help", no_argument, 0, 'h'},
        {"limits", required_argument, 0, 'l'},
        {"policy", required_argument, 0, 'p'},
        {"raw", no_argument, 0, 'r'},
        {"no-sort", no_argument, 0, 's'},
        {"version", no_argument, 0, 'v'},
        {0, 0, 0, 0},
        // clang-format on
    };

    int option_index = 0;
    while (optind < argc) {
        int arg = getopt_long(argc, argv, "c:hl:p:rsv", long_options, &option_index);
        if (arg == -1) {
            break;
        }
        switch (static_cast<char>(arg)) {
        case 'c':
            config_path = optarg;
            break;
        case 'h':
            PrintHelp(argv[0]);
            return 0;
        case 'l':
            limits_override = optarg;
            break;
        case 'p':
            policy_override = optarg;
            break;
        case 'r':
            raw_override = true;
            break;
        case 's':
            no_sort_override = true;
            break;
        case 'v':
            PrintVersion();
            return 0;
        default:
            PrintHelp(argv[0]);
            return 1;
        }
    }

    std::vector<std::string> invalid_config_entries;
    if (config_path) {
        TzdumpConfig config{*config_path};
        if (!config.IsLoaded()) {
            std::cerr << "Unable to load configuration file " << *config_path << "\n";
            return 1;
        }
        invalid_config_entries = config.InvalidEntries();
    }

    // Command line options take precedence over the configuration file
    if (limits_override && !Settings::values.limits_profile.TryLoadString(*limits_override)) {
        std::cerr << "Invalid limits profile: " << *limits_override << "\n";
        PrintHelp(argv[0]);
        return 1;
    }
    if (policy_override && !Settings::values.type_index_policy.TryLoadString(*policy_override)) {
        std::cerr << "Invalid type index policy: " << *policy_override << "\n";
        PrintHelp(argv[0]);
        return 1;
    }
    if (raw_override) {
        Settings::values.show_raw = true;
    }
    if (no_sort_override) {
        Settings::values.sort_transitions = false;
    }

    Common::Log::Initialize();
    for (const auto& entry : invalid_config_entries) {
        LOG_WARNING(Config, "Ignoring invalid configuration value {}, using the default", entry);
    }
    Settings::LogSettings();

    if (optind >= argc) {
        LOG_CRITICAL(Frontend, "No zoneinfo file specified");
        PrintHelp(argv[0]);
        return 1;
    }

    bool success = true;
    for (int i = optind; i < argc; i++) {
        success &= DumpFile(argv[i]);
    }

    Common::Log::Stop();
    return success ? 0 : 1;
}
