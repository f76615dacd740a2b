// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file wizard_context.h
 * @brief Shared, serializable state bag passed between wizard steps
 *
 * The context is the only channel through which steps communicate. Each slot
 * holds a JSON value (scalar, identifier or nested record). Once a slot is
 * finalized it is immutable until reset() is called.
 *
 * One context is owned by exactly one WizardController. It is never shared
 * between wizard instances.
 *
 * Snapshot format:
 * @code
 * {
 *   "wizard_id": "3f2a...",
 *   "reference_number": "SRV-20260118153045-3F2A",
 *   "slots": {"building_id": "B1", "unit_id": "U1"},
 *   "finalized": ["building_id", "unit_id"]
 * }
 * @endcode
 */

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "hv/json.hpp"

namespace waypoint {

using json = nlohmann::json;

/// Thrown by WizardContext::set() when the slot was already finalized
class ImmutableFieldError : public std::logic_error {
  public:
    explicit ImmutableFieldError(const std::string& key)
        : std::logic_error("Context slot '" + key + "' is finalized"), key_(key) {}

    const std::string& key() const {
        return key_;
    }

  private:
    std::string key_;
};

class WizardContext {
  public:
    /**
     * @param reference_prefix Prefix for the human-readable reference number
     */
    explicit WizardContext(const std::string& reference_prefix = "WIZ");

    /**
     * @brief Get slot value
     * @throws std::out_of_range if the slot has never been written
     */
    const json& get(const std::string& key) const;

    /// Get slot value, or default_value if the slot is missing
    json get(const std::string& key, const json& default_value) const;

    bool contains(const std::string& key) const;

    /**
     * @brief Write a slot
     * @throws ImmutableFieldError if the slot is finalized
     */
    void set(const std::string& key, json value);

    /**
     * @brief Make a written slot immutable
     * @throws std::invalid_argument if the slot has never been written
     */
    void mark_finalized(const std::string& key);

    bool is_finalized(const std::string& key) const;

    /// Slot names in sorted order
    std::vector<std::string> keys() const;

    size_t size() const {
        return slots_.size();
    }

    bool empty() const {
        return slots_.empty();
    }

    /// Serialize slots, finalized set and identity
    json to_snapshot() const;

    /**
     * @brief Replace all state from a snapshot
     *
     * The snapshot is fully validated before anything is changed.
     *
     * @throws std::invalid_argument if the snapshot is malformed
     */
    void restore_from_snapshot(const json& snapshot);

    /**
     * @brief Explicit reset: drops every slot and finalized mark
     *
     * Identity (wizard_id, reference_number) is regenerated so a reset
     * context is a new session.
     */
    void reset();

    const std::string& wizard_id() const {
        return wizard_id_;
    }

    const std::string& reference_number() const {
        return reference_number_;
    }

  private:
    void regenerate_identity();

    std::map<std::string, json> slots_;
    std::set<std::string> finalized_;
    std::string reference_prefix_;
    std::string wizard_id_;
    std::string reference_number_;
};

} // namespace waypoint
