// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <stdexcept>

#include "common/assert.h"
#include "common/logging/backend.h"

void unreachable_impl() {
    Common::Log::Stop();
    throw std::logic_error("Unreachable code");
}
