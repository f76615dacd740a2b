// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "step_navigator.h"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace waypoint {

const char* nav_result_name(NavResult result) {
    switch (result) {
    case NavResult::Advanced:
        return "advanced";
    case NavResult::ReachedEnd:
        return "reached_end";
    case NavResult::MovedBack:
        return "moved_back";
    case NavResult::NoOp:
        return "no_op";
    case NavResult::ValidationFailed:
        return "validation_failed";
    case NavResult::RetryRequired:
        return "retry_required";
    case NavResult::Fatal:
        return "fatal";
    }
    return "unknown";
}

StepNavigator::StepNavigator(StepSequence& steps, WizardContext& ctx, IdempotencyGuard& guard)
    : steps_(steps), ctx_(ctx), guard_(guard) {
    for (size_t i = 0; i < steps_.size(); ++i) {
        guard_.register_step(steps_.at(i).id());
    }
}

void StepNavigator::show(size_t index) {
    WizardStep& step = steps_.at(index);
    step.initialize();
    step.set_status(StepStatus::Active);
    step.on_show(ctx_);
    spdlog::debug("[StepNavigator] Showing step {}/{} '{}'", index + 1, steps_.size(), step.id());
}

void StepNavigator::start() {
    index_ = 0;
    show(index_);
}

int StepNavigator::progress_percent() const {
    if (steps_.size() <= 1) {
        return 100;
    }
    return static_cast<int>((index_ * 100) / (steps_.size() - 1));
}

void StepNavigator::go_next(std::shared_ptr<std::atomic<bool>> alive, NavCallback done) {
    WizardStep& step = current_step();
    const size_t from = index_;

    ValidationResult validation = step.validate(ctx_);
    if (!validation.valid) {
        spdlog::debug("[StepNavigator] '{}' failed validation ({} error(s))", step.id(),
                      validation.errors.size());
        NavOutcome out;
        out.result = NavResult::ValidationFailed;
        out.index = from;
        out.error = WizardError::local_validation(validation, step.id());
        out.validation = std::move(validation);
        done(out);
        return;
    }
    if (validation.has_warnings()) {
        spdlog::info("[StepNavigator] '{}' passed with warnings: {}", step.id(),
                     validation.summary());
    }

    StepCompletion on_committed(std::move(alive), [this, from, done](const StepOutcome& outcome) {
        NavOutcome out;
        out.index = from;

        switch (outcome.kind) {
        case OutcomeKind::Advance: {
            WizardStep& committed = steps_.at(from);
            committed.set_status(StepStatus::Completed);
            if (from + 1 >= steps_.size()) {
                out.result = NavResult::ReachedEnd;
                break;
            }
            committed.on_hide(ctx_);
            index_ = from + 1;
            show(index_);
            out.result = NavResult::Advanced;
            out.index = index_;
            break;
        }
        case OutcomeKind::RetryWithErrors:
            out.result = NavResult::RetryRequired;
            out.error = outcome.error;
            if (outcome.error.kind == WizardErrorKind::RemoteValidation) {
                out.validation = outcome.error.as_validation();
            }
            break;
        case OutcomeKind::Fatal:
            out.result = NavResult::Fatal;
            out.error = outcome.error;
            break;
        }

        spdlog::debug("[StepNavigator] next from {} -> {} ({})", from, out.index,
                      nav_result_name(out.result));
        done(out);
    });

    step.commit(ctx_, guard_, on_committed);
}

NavOutcome StepNavigator::go_back() {
    NavOutcome out;
    out.index = index_;
    if (!can_go_back()) {
        out.result = NavResult::NoOp;
        return out;
    }

    current_step().on_hide(ctx_);
    --index_;
    show(index_);

    out.result = NavResult::MovedBack;
    out.index = index_;
    return out;
}

void StepNavigator::restore(size_t index, const json& step_data) {
    if (index >= steps_.size()) {
        throw std::out_of_range("Step index " + std::to_string(index) + " out of range");
    }

    for (size_t i = 0; i < steps_.size(); ++i) {
        WizardStep& step = steps_.at(i);
        step.clear_data();
        if (step_data.is_object() && step_data.contains(step.id())) {
            step.restore_data(step_data[step.id()]);
        }
        step.set_status(guard_.has_committed(step.id()) ? StepStatus::Completed
                                                        : StepStatus::NotStarted);
    }

    index_ = index;
    show(index_);
    spdlog::info("[StepNavigator] Resumed at step {}/{} '{}'", index_ + 1, steps_.size(),
                 current_step().id());
}

json StepNavigator::collect_step_data() const {
    json out = json::object();
    for (size_t i = 0; i < steps_.size(); ++i) {
        const WizardStep& step = steps_.at(i);
        out[step.id()] = step.collect_data();
    }
    return out;
}

void StepNavigator::reset() {
    for (size_t i = 0; i < steps_.size(); ++i) {
        steps_.at(i).clear_data();
        steps_.at(i).set_status(StepStatus::NotStarted);
    }
    index_ = 0;
}

} // namespace waypoint
