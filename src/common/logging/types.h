// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include "common/common_types.h"

namespace Common::Log {

/// Specifies the severity or level of detail of the log message.
enum class Level : u8 {
    Trace,    ///< Extremely detailed and repetitive debugging information that is likely to
              ///< pollute logs.
    Debug,    ///< Less detailed debugging information.
    Info,     ///< Status information from important points during execution.
    Warning,  ///< Minor or potential problems found during execution of a task.
    Error,    ///< Major problems found during execution of a task that prevent it from being
              ///< completed.
    Critical, ///< Major problems during execution that threaten the stability of the entire
              ///< application.

    Count ///< Total number of logging levels
};

/**
 * Specifies the sub-system that generated the log message.
 *
 * @note If you add a new entry here, also add a corresponding one to `ALL_LOG_CLASSES` in
 * filter.cpp.
 */
enum class Class : u8 {
    Log,         ///< Messages about the log system itself
    Common,      ///< Library routines
    Config,      ///< Configuration (including commandline)
    Debug,       ///< Debugging tools
    Tzif,        ///< TZif decoding
    Tzif_Parser, ///< Structural parsing of the binary layout
    Tzif_Cooker, ///< Resolution of the raw records into the zone model
    Frontend,    ///< Command line tools
    Count        ///< Total number of logging classes
};

} // namespace Common::Log
