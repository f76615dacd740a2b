// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wizard_types.h"

namespace waypoint {

const char* step_status_name(StepStatus status) {
    switch (status) {
    case StepStatus::NotStarted:
        return "not_started";
    case StepStatus::Active:
        return "active";
    case StepStatus::Completed:
        return "completed";
    }
    return "unknown";
}

std::string ValidationResult::summary() const {
    std::string out;
    for (const auto& err : errors) {
        if (!out.empty()) {
            out += "\n";
        }
        out += err.field.empty() ? err.message : err.field + ": " + err.message;
    }
    for (const auto& warning : warnings) {
        if (!out.empty()) {
            out += "\n";
        }
        out += warning;
    }
    return out;
}

} // namespace waypoint
