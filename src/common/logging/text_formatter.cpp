// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <cstdio>

#include <fmt/color.h>
#include <fmt/format.h>

#include "common/logging/filter.h"
#include "common/logging/log_entry.h"
#include "common/logging/text_formatter.h"

namespace Common::Log {

namespace {
fmt::text_style StyleForLevel(Level level) {
    switch (level) {
    case Level::Trace:
        return fmt::fg(fmt::terminal_color::bright_black);
    case Level::Debug:
        return fmt::fg(fmt::terminal_color::cyan);
    case Level::Info:
        return fmt::fg(fmt::terminal_color::white);
    case Level::Warning:
        return fmt::fg(fmt::terminal_color::bright_yellow);
    case Level::Error:
        return fmt::fg(fmt::terminal_color::bright_red);
    case Level::Critical:
        return fmt::fg(fmt::terminal_color::bright_magenta);
    case Level::Count:
        break;
    }
    return {};
}
} // Anonymous namespace

std::string FormatLogMessage(const Entry& entry) {
    const auto micros = entry.timestamp.count();
    return fmt::format("[{:4d}.{:06d}] {} <{}> {}:{}:{}: {}", micros / 1000000, micros % 1000000,
                       GetLogClassName(entry.log_class), GetLevelName(entry.log_level),
                       entry.filename, entry.function, entry.line_num, entry.message);
}

void PrintMessage(const Entry& entry, bool colored) {
    if (colored) {
        fmt::print(stderr, StyleForLevel(entry.log_level), "{}", FormatLogMessage(entry));
        std::fputc('\n', stderr);
    } else {
        fmt::print(stderr, "{}\n", FormatLogMessage(entry));
    }
}

} // namespace Common::Log
