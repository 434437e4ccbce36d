// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <string>

namespace Common::Log {

struct Entry;

/// Renders an entry as "[seconds.micros] Class <Level> file:function:line: message".
std::string FormatLogMessage(const Entry& entry);

/// Writes the formatted entry to stderr, colored by severity when `colored` is set.
void PrintMessage(const Entry& entry, bool colored);

} // namespace Common::Log
