// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "wizard_controller.h"

#include <string>
#include <utility>
#include <vector>

#include "hv/json.hpp"

namespace waypoint_test {

/// WizardListener that keeps every notification for later inspection
class RecordingListener : public waypoint::WizardListener {
  public:
    std::vector<waypoint::WizardState> states;
    std::vector<size_t> steps;
    std::vector<std::pair<std::string, waypoint::ValidationResult>> validation_failures;
    std::vector<waypoint::WizardError> errors;
    std::vector<bool> busy;
    std::vector<std::string> saved_drafts;
    std::vector<nlohmann::json> completed;
    int cancelled = 0;

    void on_state_changed(waypoint::WizardState state) override {
        states.push_back(state);
    }

    void on_step_changed(size_t index, const waypoint::WizardStep& /*step*/) override {
        steps.push_back(index);
    }

    void on_validation_failed(const std::string& step_id,
                              const waypoint::ValidationResult& result) override {
        validation_failures.emplace_back(step_id, result);
    }

    void on_error(const waypoint::WizardError& error) override {
        errors.push_back(error);
    }

    void on_busy_changed(bool is_busy) override {
        busy.push_back(is_busy);
    }

    void on_draft_saved(const std::string& draft_id) override {
        saved_drafts.push_back(draft_id);
    }

    void on_completed(const nlohmann::json& final_snapshot) override {
        completed.push_back(final_snapshot);
    }

    void on_cancelled() override {
        ++cancelled;
    }
};

} // namespace waypoint_test
