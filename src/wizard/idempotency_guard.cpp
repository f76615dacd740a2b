// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "idempotency_guard.h"

#include <spdlog/spdlog.h>

namespace waypoint {

void IdempotencyGuard::register_step(const std::string& step_id) {
    flags_.emplace(step_id, false);
}

bool IdempotencyGuard::has_committed(const std::string& step_id) const {
    auto it = flags_.find(step_id);
    return it != flags_.end() && it->second;
}

void IdempotencyGuard::mark_committed(const std::string& step_id) {
    auto& flag = flags_[step_id];
    if (!flag) {
        flag = true;
        spdlog::debug("[IdempotencyGuard] {} committed", step_id);
    }
}

void IdempotencyGuard::reset(const std::string& step_id) {
    auto it = flags_.find(step_id);
    if (it != flags_.end() && it->second) {
        it->second = false;
        spdlog::info("[IdempotencyGuard] {} reset", step_id);
    }
}

void IdempotencyGuard::reset_all() {
    for (auto& [id, flag] : flags_) {
        flag = false;
    }
}

bool IdempotencyGuard::any_committed() const {
    for (const auto& [id, flag] : flags_) {
        if (flag) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> IdempotencyGuard::committed_steps() const {
    std::vector<std::string> out;
    for (const auto& [id, flag] : flags_) {
        if (flag) {
            out.push_back(id);
        }
    }
    return out;
}

void IdempotencyGuard::restore(const std::map<std::string, bool>& flags) {
    // Keep registered steps known even if the draft predates them
    for (auto& [id, flag] : flags_) {
        flag = false;
    }
    for (const auto& [id, flag] : flags) {
        flags_[id] = flag;
    }
}

} // namespace waypoint
