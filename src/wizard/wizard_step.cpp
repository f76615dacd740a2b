// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wizard_step.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

namespace waypoint {

const char* outcome_kind_name(OutcomeKind kind) {
    switch (kind) {
    case OutcomeKind::Advance:
        return "advance";
    case OutcomeKind::RetryWithErrors:
        return "retry";
    case OutcomeKind::Fatal:
        return "fatal";
    }
    return "unknown";
}

// ============================================================================
// StepCompletion
// ============================================================================

StepCompletion::StepCompletion(std::shared_ptr<std::atomic<bool>> alive, Handler handler)
    : state_(std::make_shared<State>()) {
    state_->alive = std::move(alive);
    state_->handler = std::move(handler);
}

bool StepCompletion::cancelled() const {
    return !state_->alive || !state_->alive->load() || state_->fired.load();
}

void StepCompletion::operator()(const StepOutcome& outcome) const {
    if (!state_->alive || !state_->alive->load()) {
        spdlog::debug("[StepCompletion] Session gone, dropping {} outcome",
                      outcome_kind_name(outcome.kind));
        return;
    }
    if (state_->fired.exchange(true)) {
        LOG_WARN_INTERNAL("Step completion invoked twice, ignoring {} outcome",
                          outcome_kind_name(outcome.kind));
        return;
    }
    if (state_->handler) {
        state_->handler(outcome);
    }
}

const std::shared_ptr<std::atomic<bool>>& StepCompletion::alive() const {
    return state_->alive;
}

// ============================================================================
// WizardStep
// ============================================================================

WizardStep::WizardStep(std::string id, std::string title)
    : id_(std::move(id)), title_(std::move(title)) {}

void WizardStep::initialize() {
    if (initialized_) {
        return;
    }
    setup();
    initialized_ = true;
    spdlog::trace("[WizardStep] {} initialized", id_);
}

void WizardStep::set_status(StepStatus status) {
    if (status_ != status) {
        spdlog::trace("[WizardStep] {}: {} -> {}", id_, step_status_name(status_),
                      step_status_name(status));
        status_ = status;
    }
}

void WizardStep::commit(WizardContext& ctx, IdempotencyGuard& guard, StepCompletion done) {
    if (guard.has_committed(id_)) {
        spdlog::info("[WizardStep] {} already committed, skipping remote work", id_);
        done(StepOutcome::advance());
        return;
    }

    const std::string step_id = id_;
    StepCompletion guarded(done.alive(), [&guard, step_id, done](const StepOutcome& outcome) {
        if (outcome.kind == OutcomeKind::Advance || outcome.committed) {
            guard.mark_committed(step_id);
        }
        done(outcome);
    });

    try {
        on_next(ctx, guarded);
    } catch (const ImmutableFieldError& e) {
        LOG_ERROR_INTERNAL("{} tried to overwrite finalized slot '{}'", step_id, e.key());
        guarded(StepOutcome::fatal(WizardError::internal(e.what(), step_id)));
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("{} on_next threw: {}", step_id, e.what());
        guarded(StepOutcome::fatal(WizardError::internal(e.what(), step_id)));
    }
}

} // namespace waypoint
