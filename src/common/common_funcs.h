// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#define CONCAT2(x, y) DO_CONCAT2(x, y)
#define DO_CONCAT2(x, y) x##y

#define ZONEINFO_NON_COPYABLE(cls)                                                                 \
    cls(const cls&) = delete;                                                                      \
    cls& operator=(const cls&) = delete

#define ZONEINFO_NON_MOVEABLE(cls)                                                                 \
    cls(cls&&) = delete;                                                                           \
    cls& operator=(cls&&) = delete
