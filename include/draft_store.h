// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "hv/json.hpp"

namespace waypoint {

/**
 * @brief Persisted snapshot enabling a wizard to resume
 */
struct DraftRecord {
    std::string id;               ///< Empty until the store assigns one
    nlohmann::json context_snapshot;
    size_t current_step_index = 0;
    std::map<std::string, bool> guard_flags;
    nlohmann::json step_data = nlohmann::json::object(); ///< step id -> collect_data()
    std::string reference_number;
    std::string created_at; ///< ISO 8601 UTC
    std::string updated_at; ///< ISO 8601 UTC
    bool completed = false;
};

/**
 * @brief Persistence boundary for drafts
 *
 * Implementations report failures through their return values and log the
 * cause; they never throw.
 */
class DraftStore {
  public:
    virtual ~DraftStore() = default;

    /**
     * @brief Insert or replace a draft
     *
     * @return The record id (assigned if record.id was empty), or nullopt on failure
     */
    virtual std::optional<std::string> save(const DraftRecord& record) = 0;

    /// @return The record, or nullopt if no such draft exists or it is unreadable
    virtual std::optional<DraftRecord> load(const std::string& id) = 0;

    /// @return true if a draft was removed
    virtual bool remove(const std::string& id) = 0;

    /// Ids of all stored drafts, sorted
    virtual std::vector<std::string> list_ids() = 0;
};

} // namespace waypoint
