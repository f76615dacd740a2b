// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include "utils/paths.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>

#ifdef WAYPOINT_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif

#include <filesystem>
#include <vector>

namespace waypoint {
namespace logging {

namespace {

constexpr const char* LOGGER_NAME = "waypoint";

spdlog::sink_ptr make_console_sink() {
    return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
}

spdlog::sink_ptr make_file_sink(const LogConfig& config) {
    std::filesystem::path path = config.file_path.empty() ? default_log_file() : config.file_path;
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        // An uncreatable directory surfaces as spdlog_ex when the sink opens
    }
    return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path.string(), config.max_file_size, config.max_files == 0 ? 1 : config.max_files);
}

spdlog::sink_ptr make_syslog_sink() {
    return std::make_shared<spdlog::sinks::syslog_sink_mt>(LOGGER_NAME, LOG_PID, LOG_USER, false);
}

/// Sink for the configured target; throws spdlog_ex if it cannot be opened
spdlog::sink_ptr make_target_sink(const LogConfig& config, LogTarget& effective) {
    effective = config.target;
    switch (config.target) {
    case LogTarget::File:
        return make_file_sink(config);
    case LogTarget::Syslog:
        return make_syslog_sink();
    case LogTarget::Journal:
#ifdef WAYPOINT_HAS_SYSTEMD
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(LOGGER_NAME);
#else
        effective = LogTarget::Syslog;
        return make_syslog_sink();
#endif
    case LogTarget::Console:
        break;
    }
    effective = LogTarget::Console;
    return make_console_sink();
}

} // namespace

std::string default_log_file() {
    return data_dir() + "/waypoint.log";
}

LogTarget init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    LogTarget effective = LogTarget::Console;
    std::string sink_error;

    try {
        sinks.push_back(make_target_sink(config, effective));
    } catch (const spdlog::spdlog_ex& e) {
        sink_error = e.what();
        effective = LogTarget::Console;
        sinks.push_back(make_console_sink());
    }

    if (config.echo_to_console && effective != LogTarget::Console) {
        sinks.push_back(make_console_sink());
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    if (!sink_error.empty()) {
        spdlog::warn("[Logging] {} sink unavailable ({}), logging to console",
                     log_target_name(config.target), sink_error);
    } else if (effective != config.target) {
        spdlog::info("[Logging] {} not built in, using {}", log_target_name(config.target),
                     log_target_name(effective));
    }
    spdlog::debug("[Logging] Initialized: target={}, level={}", log_target_name(effective),
                  spdlog::level::to_string_view(config.level));
    return effective;
}

LogTarget parse_log_target(const std::string& str, LogTarget def) {
    for (LogTarget target :
         {LogTarget::Console, LogTarget::File, LogTarget::Syslog, LogTarget::Journal}) {
        if (str == log_target_name(target)) {
            return target;
        }
    }
    return def;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Console:
        return "console";
    case LogTarget::File:
        return "file";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::Journal:
        return "journal";
    }
    return "unknown";
}

spdlog::level::level_enum parse_log_level(const std::string& str, spdlog::level::level_enum def) {
    if (str.empty()) {
        return def;
    }
    // from_str returns off for unknown names
    auto level = spdlog::level::from_str(str);
    if (level == spdlog::level::off && str != "off") {
        return def;
    }
    return level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity <= 0) {
        return spdlog::level::warn;
    }
    if (verbosity == 1) {
        return spdlog::level::info;
    }
    return verbosity == 2 ? spdlog::level::debug : spdlog::level::trace;
}

} // namespace logging
} // namespace waypoint
