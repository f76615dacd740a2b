// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

/**
 * @file error_reporting.h
 * @brief Logging macros that separate engine faults from user-facing failures
 *
 * Internal messages describe programming or I/O faults inside the engine.
 * User messages mirror what the presentation layer is about to show, so the
 * log reads like the session the user saw.
 *
 * Usage Examples:
 * ```cpp
 * // Engine fault (logged, never shown as-is)
 * LOG_ERROR_INTERNAL("Failed to write draft {}: {}", path, e.what());
 *
 * // Failure surfaced to the user through WizardListener::on_error()
 * LOG_USER_ERROR("{}: {}", err.get_kind_string(), err.user_message());
 * ```
 */

#define LOG_ERROR_INTERNAL(msg, ...) spdlog::error("[INTERNAL] " msg, ##__VA_ARGS__)

#define LOG_WARN_INTERNAL(msg, ...) spdlog::warn("[INTERNAL] " msg, ##__VA_ARGS__)

#define LOG_USER_ERROR(msg, ...) spdlog::error("[USER] " msg, ##__VA_ARGS__)

#define LOG_USER_WARNING(msg, ...) spdlog::warn("[USER] " msg, ##__VA_ARGS__)

#define LOG_USER_INFO(msg, ...) spdlog::info("[USER] " msg, ##__VA_ARGS__)
