// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file draft_codec.h
 * @brief DraftRecord <-> JSON
 *
 * Format (version 1):
 * @code
 * {
 *   "version": 1,
 *   "id": "draft-20260118153045-9c1e22aa",
 *   "reference_number": "SRV-20260118153045-3F2A",
 *   "created_at": "2026-01-18T15:30:45Z",
 *   "updated_at": "2026-01-18T15:41:02Z",
 *   "completed": false,
 *   "current_step_index": 2,
 *   "guard_flags": {"building": true, "unit": true, "household": false},
 *   "context": { ...WizardContext::to_snapshot()... },
 *   "step_data": {"household": {"size": 4}}
 * }
 * @endcode
 */

#include "draft_store.h"

#include <optional>
#include <string>

#include "hv/json.hpp"

namespace waypoint {

constexpr int DRAFT_FORMAT_VERSION = 1;

nlohmann::json draft_to_json(const DraftRecord& record);

/**
 * @brief Parse a draft
 *
 * @param j Parsed JSON document
 * @param error Receives a description when parsing fails (optional)
 * @return The record, or nullopt if required members are missing or mistyped
 */
std::optional<DraftRecord> draft_from_json(const nlohmann::json& j, std::string* error = nullptr);

} // namespace waypoint
