// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include "common/logging/log.h"

/// Flushes the log and throws std::logic_error. Kept out of line so the macro below stays small.
[[noreturn]] void unreachable_impl();

/// Marks a branch that valid program states never reach, such as an enum value outside its
/// declared range.
#define UNREACHABLE_MSG(...)                                                                       \
    do {                                                                                           \
        LOG_CRITICAL(Debug, "Unreachable code!\n" __VA_ARGS__);                                    \
        unreachable_impl();                                                                        \
    } while (0)
