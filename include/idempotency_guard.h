// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <map>
#include <string>
#include <vector>

namespace waypoint {

/**
 * @brief Per-step record of committed remote mutations
 *
 * A flag only ever moves False -> True on its own. It goes back to False
 * solely through reset()/reset_all(), which the controller calls on an
 * explicit context reset or cancellation.
 *
 * Keyed by step identity, never by navigation count.
 */
class IdempotencyGuard {
  public:
    /// Reserved key used by the wizard-level finish operation
    static constexpr const char* FINISH_KEY = "__finish__";

    /// Make a step known so it shows up (as False) in flags()
    void register_step(const std::string& step_id);

    bool has_committed(const std::string& step_id) const;

    void mark_committed(const std::string& step_id);

    void reset(const std::string& step_id);

    void reset_all();

    bool any_committed() const;

    /// Step ids whose flag is True, in sorted order
    std::vector<std::string> committed_steps() const;

    /// All known flags, used for draft snapshots
    const std::map<std::string, bool>& flags() const {
        return flags_;
    }

    /// Replace all flags (draft resume only)
    void restore(const std::map<std::string, bool>& flags);

  private:
    std::map<std::string, bool> flags_;
};

} // namespace waypoint
