// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>

namespace waypoint {
namespace logging {

/// Destination of the "waypoint" logger
enum class LogTarget {
    Console, ///< Colored stderr; stdout stays free for replay transcripts
    File,    ///< Rotating file under data_dir() unless file_path is set
    Syslog,
    Journal, ///< systemd journal; syslog when built without WAYPOINT_HAS_SYSTEMD
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    LogTarget target = LogTarget::Console;
    std::string file_path;                  ///< File only; empty uses default_log_file()
    size_t max_file_size = 5 * 1024 * 1024; ///< Bytes before rotation
    size_t max_files = 3;
    bool echo_to_console = false; ///< Also log to stderr when target is not Console
};

/// $XDG_DATA_HOME/waypoint/waypoint.log
std::string default_log_file();

/**
 * @brief Install the default "waypoint" logger
 *
 * A sink that cannot be opened (unwritable file, no syslog) falls back to the
 * console. Safe to call more than once.
 *
 * @return The target actually in use
 */
LogTarget init(const LogConfig& config);

/// "console", "file", "syslog", "journal"; anything else gives def
LogTarget parse_log_target(const std::string& str, LogTarget def = LogTarget::Console);

const char* log_target_name(LogTarget target);

/// spdlog level names ("trace" .. "off"); unknown strings give def
spdlog::level::level_enum parse_log_level(const std::string& str,
                                          spdlog::level::level_enum def = spdlog::level::info);

/// Map -v repetitions to a level: 0 warn, 1 info, 2 debug, 3+ trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

} // namespace logging
} // namespace waypoint
