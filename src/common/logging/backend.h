// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include "common/logging/filter.h"

namespace Common::Log {

/**
 * Starts delivering log messages, filtered by Settings::values.log_filter and additionally
 * written to Settings::values.log_file when that is set. Messages logged before this call are
 * dropped.
 */
void Initialize();

/// Flushes all backends.
void Stop();

/// Drops all log messages, even after Initialize.
void DisableLoggingInTests();

} // namespace Common::Log
