// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "idempotency_guard.h"
#include "wizard_builder.h"
#include "wizard_context.h"
#include "wizard_step.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>

#include "hv/json.hpp"

namespace waypoint {

enum class NavResult {
    Advanced,         ///< Moved to the next step
    ReachedEnd,       ///< Last step committed; wizard-level finish is next
    MovedBack,        ///< Moved to the previous step
    NoOp,             ///< Back at index 0
    ValidationFailed, ///< validate() rejected the step; nothing ran
    RetryRequired,    ///< on_next reported a recoverable failure
    Fatal,            ///< on_next reported an unrecoverable failure
};

const char* nav_result_name(NavResult result);

struct NavOutcome {
    NavResult result = NavResult::NoOp;
    size_t index = 0; ///< Index after the transition
    ValidationResult validation;
    WizardError error;
};

/**
 * @brief Sequencing and transition gating between steps
 *
 * Forward: validate -> commit (guarded on_next) -> on_hide -> index++ -> on_show.
 * Backward: on_hide -> index-- -> on_show. Never validates, never commits.
 *
 * The navigator does not track in-flight operations; the controller makes
 * sure go_next() is not re-entered while a commit is outstanding.
 */
class StepNavigator {
  public:
    using NavCallback = std::function<void(const NavOutcome&)>;

    StepNavigator(StepSequence& steps, WizardContext& ctx, IdempotencyGuard& guard);

    /// Show step 0 (initializing it)
    void start();

    size_t current() const {
        return index_;
    }

    size_t step_count() const {
        return steps_.size();
    }

    bool can_go_back() const {
        return index_ > 0;
    }

    bool can_go_next() const {
        return index_ + 1 < steps_.size();
    }

    bool is_last() const {
        return index_ + 1 == steps_.size();
    }

    WizardStep& current_step() {
        return steps_.at(index_);
    }

    StepStatus status(size_t index) const {
        return steps_.at(index).status();
    }

    /// 0-100 position indicator
    int progress_percent() const;

    /**
     * @brief Attempt a forward transition
     *
     * @param alive Session flag; a completion arriving after it drops is ignored
     * @param done Receives the outcome, possibly after this call returns
     */
    void go_next(std::shared_ptr<std::atomic<bool>> alive, NavCallback done);

    NavOutcome go_back();

    /**
     * @brief Jump to a saved position without running any step logic
     *
     * Steps whose guard flag is True become Completed, the rest NotStarted.
     * Local step data is re-applied from step_data (keyed by step id), then
     * the target is shown.
     */
    void restore(size_t index, const nlohmann::json& step_data);

    /// Local data of every step keyed by id, for drafts
    nlohmann::json collect_step_data() const;

    /// Back to step 0 with every status cleared
    void reset();

  private:
    void show(size_t index);

    StepSequence& steps_;
    WizardContext& ctx_;
    IdempotencyGuard& guard_;
    size_t index_ = 0;
};

} // namespace waypoint
