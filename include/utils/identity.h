// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace waypoint {

/// Format a UTC time point with strftime syntax (e.g. "%Y%m%d%H%M%S")
std::string format_utc(std::chrono::system_clock::time_point tp, const char* fmt);

/// Current UTC time as ISO 8601 ("2026-01-18T15:30:45Z")
std::string iso8601_now();

/// Lowercase hex string of the given length from a non-deterministic source
std::string random_hex(size_t length);

/// Random 8-4-4-4-12 identifier (UUID v4 layout)
std::string generate_uuid();

} // namespace waypoint
