// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wizard_controller.h"

#include "error_reporting.h"
#include "utils/identity.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

using json = nlohmann::json;

namespace waypoint {

// =============================================================================
// Enum names
// =============================================================================

const char* wizard_state_name(WizardState state) {
    switch (state) {
    case WizardState::NotStarted:
        return "not_started";
    case WizardState::Active:
        return "active";
    case WizardState::AwaitingReauth:
        return "awaiting_reauth";
    case WizardState::Halted:
        return "halted";
    case WizardState::Completed:
        return "completed";
    case WizardState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char* command_status_name(CommandStatus status) {
    switch (status) {
    case CommandStatus::Accepted:
        return "accepted";
    case CommandStatus::NoOp:
        return "no_op";
    case CommandStatus::Busy:
        return "busy";
    case CommandStatus::ReauthRequired:
        return "reauth_required";
    case CommandStatus::NotReady:
        return "not_ready";
    case CommandStatus::InvalidState:
        return "invalid_state";
    }
    return "unknown";
}

const char* draft_save_status_name(DraftSaveStatus status) {
    switch (status) {
    case DraftSaveStatus::Saved:
        return "saved";
    case DraftSaveStatus::Deferred:
        return "deferred";
    case DraftSaveStatus::NoStore:
        return "no_store";
    case DraftSaveStatus::InvalidState:
        return "invalid_state";
    case DraftSaveStatus::Failed:
        return "failed";
    }
    return "unknown";
}

const char* draft_load_status_name(DraftLoadStatus status) {
    switch (status) {
    case DraftLoadStatus::Loaded:
        return "loaded";
    case DraftLoadStatus::NoStore:
        return "no_store";
    case DraftLoadStatus::Busy:
        return "busy";
    case DraftLoadStatus::NotFound:
        return "not_found";
    case DraftLoadStatus::AlreadyCompleted:
        return "already_completed";
    case DraftLoadStatus::OutOfRange:
        return "out_of_range";
    case DraftLoadStatus::Malformed:
        return "malformed";
    case DraftLoadStatus::Blocked:
        return "blocked";
    }
    return "unknown";
}

// =============================================================================
// Lifecycle
// =============================================================================

WizardController::WizardController(std::unique_ptr<StepSequence> steps,
                                   std::shared_ptr<DraftStore> drafts,
                                   WizardControllerOptions options)
    : steps_(std::move(steps)), drafts_(std::move(drafts)), options_(options),
      context_(steps_ ? steps_->reference_prefix() : std::string("WIZ")),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
    if (!steps_) {
        throw std::invalid_argument("WizardController needs a step sequence");
    }
    navigator_ = std::make_unique<StepNavigator>(*steps_, context_, guard_);
    spdlog::debug("[WizardController] Created with {} steps (drafts: {})", steps_->size(),
                  drafts_ ? "enabled" : "disabled");
}

WizardController::~WizardController() {
    alive_->store(false);
    if (busy_) {
        spdlog::debug("[WizardController] Destroyed with a remote call outstanding");
    }
}

WizardStep* WizardController::find_step(const std::string& step_id) {
    auto index = steps_->index_of(step_id);
    return index ? &steps_->at(*index) : nullptr;
}

void WizardController::invalidate_pending() {
    alive_->store(false);
    alive_ = std::make_shared<std::atomic<bool>>(true);
}

void WizardController::discard_session() {
    context_.reset();
    guard_.reset_all();
    navigator_->reset();
    draft_id_.clear();
    draft_created_at_.clear();
    last_error_ = WizardError{};
}

void WizardController::begin_session() {
    invalidate_pending();
    discard_session();
    set_state(WizardState::Active);
    navigator_->start();
    spdlog::info("[WizardController] Session {} started", context_.reference_number());
    notify_step_changed();
}

// =============================================================================
// Commands
// =============================================================================

CommandStatus WizardController::start() {
    if (busy_) {
        return CommandStatus::Busy;
    }
    if (state_ != WizardState::NotStarted && state_ != WizardState::Completed &&
        state_ != WizardState::Cancelled) {
        spdlog::warn("[WizardController] start() while {}", wizard_state_name(state_));
        return CommandStatus::InvalidState;
    }
    begin_session();
    return CommandStatus::Accepted;
}

CommandStatus WizardController::reset() {
    if (busy_) {
        return CommandStatus::Busy;
    }
    if (state_ == WizardState::NotStarted) {
        return CommandStatus::InvalidState;
    }
    spdlog::info("[WizardController] Reset requested in state {}", wizard_state_name(state_));
    begin_session();
    return CommandStatus::Accepted;
}

CommandStatus WizardController::next() {
    if (busy_) {
        return CommandStatus::Busy;
    }
    if (state_ == WizardState::AwaitingReauth) {
        return CommandStatus::ReauthRequired;
    }
    if (state_ != WizardState::Active) {
        return CommandStatus::InvalidState;
    }

    set_busy(true);
    navigator_->go_next(alive_, [this](const NavOutcome& outcome) { handle_nav_outcome(outcome); });
    return CommandStatus::Accepted;
}

CommandStatus WizardController::previous() {
    if (busy_) {
        return CommandStatus::Busy;
    }
    if (state_ == WizardState::AwaitingReauth) {
        return CommandStatus::ReauthRequired;
    }
    if (state_ != WizardState::Active) {
        return CommandStatus::InvalidState;
    }

    NavOutcome outcome = navigator_->go_back();
    if (outcome.result == NavResult::NoOp) {
        return CommandStatus::NoOp;
    }
    last_error_ = WizardError{};
    notify_step_changed();
    return CommandStatus::Accepted;
}

CommandStatus WizardController::finish() {
    if (busy_) {
        return CommandStatus::Busy;
    }
    if (state_ == WizardState::AwaitingReauth) {
        return CommandStatus::ReauthRequired;
    }
    if (state_ != WizardState::Active) {
        return CommandStatus::InvalidState;
    }

    const WizardStep& last = steps_->at(steps_->size() - 1);
    if (last.status() != StepStatus::Completed || !guard_.has_committed(last.id())) {
        spdlog::warn("[WizardController] finish() rejected: last step '{}' is {} (guard {})",
                     last.id(), step_status_name(last.status()), guard_.has_committed(last.id()));
        return CommandStatus::NotReady;
    }

    set_busy(true);
    run_finish();
    return CommandStatus::Accepted;
}

CancelResult WizardController::cancel(bool confirmed) {
    if (state_ == WizardState::NotStarted || state_ == WizardState::Completed ||
        state_ == WizardState::Cancelled) {
        return CancelResult::InvalidState;
    }
    const size_t remote = remote_commits();
    if (!confirmed && remote > 0) {
        LOG_USER_WARNING("Cancelling will abandon {} remote commit(s); confirmation required",
                         remote);
        return CancelResult::ConfirmationRequired;
    }

    if (busy_) {
        spdlog::info("[WizardController] Cancelling with a remote call outstanding");
    }
    invalidate_pending();

    if (drafts_ && options_.delete_draft_on_cancel && !draft_id_.empty()) {
        if (!drafts_->remove(draft_id_)) {
            LOG_WARN_INTERNAL("Draft {} could not be removed on cancel", draft_id_);
        }
    }

    spdlog::info("[WizardController] Session {} cancelled", context_.reference_number());
    discard_session();
    set_state(WizardState::Cancelled);
    settle();

    if (listener_) {
        listener_->on_cancelled();
    }
    return CancelResult::Cancelled;
}

CommandStatus WizardController::notify_reauthenticated() {
    if (state_ != WizardState::AwaitingReauth) {
        return CommandStatus::InvalidState;
    }
    spdlog::info("[WizardController] Re-authenticated, navigation unblocked");
    last_error_ = WizardError{};
    set_state(WizardState::Active);
    return CommandStatus::Accepted;
}

// =============================================================================
// Transition results
// =============================================================================

void WizardController::handle_nav_outcome(const NavOutcome& outcome) {
    switch (outcome.result) {
    case NavResult::Advanced:
        last_error_ = WizardError{};
        settle();
        notify_step_changed();
        break;

    case NavResult::ReachedEnd:
        last_error_ = WizardError{};
        spdlog::info("[WizardController] Last step committed, finishing");
        run_finish();
        break;

    case NavResult::ValidationFailed: {
        const std::string step_id = navigator_->current_step().id();
        last_error_ = outcome.error;
        LOG_USER_WARNING("{}: {}", step_id, outcome.validation.summary());
        settle();
        if (listener_) {
            listener_->on_validation_failed(step_id, outcome.validation);
        }
        break;
    }

    case NavResult::RetryRequired:
        fail(outcome.error, false);
        break;

    case NavResult::Fatal:
        fail(outcome.error, true);
        break;

    case NavResult::MovedBack:
    case NavResult::NoOp:
        settle();
        break;
    }
}

void WizardController::fail(const WizardError& error, bool fatal) {
    last_error_ = error;
    if (fatal) {
        set_state(WizardState::Halted);
    } else if (error.kind == WizardErrorKind::Auth) {
        set_state(WizardState::AwaitingReauth);
    }

    LOG_USER_ERROR("{} [{}]: {}", error.step_id, error.get_kind_string(), error.user_message());
    settle();

    if (listener_) {
        if (error.kind == WizardErrorKind::RemoteValidation) {
            listener_->on_validation_failed(error.step_id, error.as_validation());
        }
        listener_->on_error(error);
    }
}

size_t WizardController::remote_commits() const {
    size_t count = 0;
    for (size_t i = 0; i < steps_->size(); ++i) {
        const WizardStep& step = steps_->at(i);
        if (step.has_remote_effect() && guard_.has_committed(step.id())) {
            ++count;
        }
    }
    if (steps_->finish_service() && guard_.has_committed(IdempotencyGuard::FINISH_KEY)) {
        ++count;
    }
    return count;
}

void WizardController::run_finish() {
    const std::string key = IdempotencyGuard::FINISH_KEY;
    StepCompletion done(alive_,
                        [this](const StepOutcome& outcome) { handle_finish_outcome(outcome); });

    if (guard_.has_committed(key)) {
        spdlog::info("[WizardController] Finish already committed, skipping remote call");
        done(StepOutcome::advance());
        return;
    }

    const auto& service = steps_->finish_service();
    if (!service) {
        guard_.mark_committed(key);
        done(StepOutcome::advance());
        return;
    }

    const std::string operation = steps_->finish_operation();
    json payload{{"wizard_id", context_.wizard_id()},
                 {"reference_number", context_.reference_number()},
                 {"context", context_.to_snapshot()["slots"]}};

    spdlog::info("[WizardController] Executing finish operation '{}'", operation);
    try {
        service->execute(
            operation, payload,
            [this, done, key](const json& identifiers) {
                if (done.cancelled()) {
                    spdlog::info("[WizardController] Finish response after cancel, discarded");
                    return;
                }
                // The remote side has applied the operation; never send it again
                guard_.mark_committed(key);
                try {
                    if (identifiers.is_object()) {
                        for (auto it = identifiers.begin(); it != identifiers.end(); ++it) {
                            if (context_.is_finalized(it.key()) &&
                                context_.get(it.key()) == it.value()) {
                                continue;
                            }
                            context_.set(it.key(), it.value());
                            context_.mark_finalized(it.key());
                        }
                    }
                } catch (const std::exception& e) {
                    LOG_ERROR_INTERNAL("Failed to apply finish result: {}", e.what());
                    done(StepOutcome::committed_fatal(WizardError::internal(e.what(), key)));
                    return;
                }
                done(StepOutcome::advance());
            },
            [done, key](const RemoteFailure& failure) {
                if (done.cancelled()) {
                    return;
                }
                done(StepOutcome::retry(WizardError::from_remote(failure, key)));
            });
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("Finish operation '{}' threw: {}", operation, e.what());
        done(StepOutcome::fatal(WizardError::internal(e.what(), key)));
    }
}

void WizardController::handle_finish_outcome(const StepOutcome& outcome) {
    switch (outcome.kind) {
    case OutcomeKind::Advance:
        complete();
        break;
    case OutcomeKind::RetryWithErrors:
        fail(outcome.error, false);
        break;
    case OutcomeKind::Fatal:
        fail(outcome.error, true);
        break;
    }
}

void WizardController::complete() {
    const json final_snapshot = context_.to_snapshot();

    if (drafts_ && !draft_id_.empty()) {
        if (options_.delete_draft_on_finish) {
            if (!drafts_->remove(draft_id_)) {
                LOG_WARN_INTERNAL("Draft {} could not be removed after finish", draft_id_);
            }
        } else if (!drafts_->save(build_record(true))) {
            LOG_WARN_INTERNAL("Draft {} could not be marked completed", draft_id_);
        }
    }

    LOG_USER_INFO("Wizard {} completed", context_.reference_number());
    discard_session();
    set_state(WizardState::Completed);
    settle();

    if (listener_) {
        listener_->on_completed(final_snapshot);
    }
}

// =============================================================================
// Drafts
// =============================================================================

DraftRecord WizardController::build_record(bool completed) const {
    DraftRecord record;
    record.id = draft_id_;
    record.context_snapshot = context_.to_snapshot();
    record.current_step_index = navigator_->current();
    record.guard_flags = guard_.flags();
    record.step_data = navigator_->collect_step_data();
    record.reference_number = context_.reference_number();

    const std::string now = iso8601_now();
    record.created_at = draft_created_at_.empty() ? now : draft_created_at_;
    record.updated_at = now;
    record.completed = completed;
    return record;
}

DraftSaveStatus WizardController::persist(std::string& saved_id) {
    DraftRecord record = build_record(false);
    auto id = drafts_->save(record);
    if (!id) {
        LOG_USER_ERROR("Draft for {} could not be saved", context_.reference_number());
        return DraftSaveStatus::Failed;
    }

    draft_id_ = *id;
    draft_created_at_ = record.created_at;
    saved_id = *id;
    spdlog::info("[WizardController] Draft {} saved at step {}", draft_id_,
                 record.current_step_index);

    if (listener_) {
        listener_->on_draft_saved(draft_id_);
    }
    return DraftSaveStatus::Saved;
}

DraftSaveStatus WizardController::save_draft(SaveCallback done) {
    if (!drafts_) {
        return DraftSaveStatus::NoStore;
    }
    if (!can_persist()) {
        if (state_ == WizardState::Halted) {
            LOG_USER_WARNING("Draft not saved: the session is halted ({})",
                             last_error_.user_message());
        }
        return DraftSaveStatus::InvalidState;
    }

    if (busy_) {
        spdlog::debug("[WizardController] Remote call outstanding, deferring draft save");
        save_pending_ = true;
        pending_save_callbacks_.push_back(std::move(done));
        return DraftSaveStatus::Deferred;
    }

    std::string id;
    DraftSaveStatus status = persist(id);
    if (done) {
        done(status, id);
    }
    return status;
}

DraftLoadStatus WizardController::load_draft(const std::string& draft_id) {
    if (!drafts_) {
        return DraftLoadStatus::NoStore;
    }
    if (busy_) {
        return DraftLoadStatus::Busy;
    }
    if (state_ == WizardState::AwaitingReauth || state_ == WizardState::Halted) {
        LOG_USER_WARNING("Draft {} not loaded: the session is {}", draft_id,
                         wizard_state_name(state_));
        return DraftLoadStatus::Blocked;
    }

    auto record = drafts_->load(draft_id);
    if (!record) {
        LOG_USER_WARNING("Draft {} not found", draft_id);
        return DraftLoadStatus::NotFound;
    }
    if (record->completed) {
        LOG_USER_WARNING("Draft {} belongs to a completed wizard", draft_id);
        return DraftLoadStatus::AlreadyCompleted;
    }
    if (record->current_step_index >= steps_->size()) {
        LOG_WARN_INTERNAL("Draft {} is at step {} but the wizard has {} steps", draft_id,
                          record->current_step_index, steps_->size());
        return DraftLoadStatus::OutOfRange;
    }
    for (const auto& [step_id, committed] : record->guard_flags) {
        if (step_id != IdempotencyGuard::FINISH_KEY && !steps_->index_of(step_id)) {
            LOG_WARN_INTERNAL("Draft {} has a guard flag for unknown step '{}'", draft_id,
                              step_id);
            return DraftLoadStatus::Malformed;
        }
    }

    // Restore into a scratch context first so a bad snapshot leaves us untouched
    WizardContext restored(steps_->reference_prefix());
    try {
        restored.restore_from_snapshot(record->context_snapshot);
    } catch (const std::invalid_argument& e) {
        LOG_WARN_INTERNAL("Draft {} has a malformed context: {}", draft_id, e.what());
        return DraftLoadStatus::Malformed;
    }

    invalidate_pending();
    context_ = std::move(restored);
    guard_.restore(record->guard_flags);
    navigator_->restore(record->current_step_index, record->step_data);

    draft_id_ = record->id.empty() ? draft_id : record->id;
    draft_created_at_ = record->created_at;
    last_error_ = WizardError{};
    set_state(WizardState::Active);

    spdlog::info("[WizardController] Resumed draft {} ({}) at step {}/{}", draft_id_,
                 context_.reference_number(), navigator_->current() + 1, steps_->size());
    notify_step_changed();
    return DraftLoadStatus::Loaded;
}

// =============================================================================
// Helpers
// =============================================================================

// A Halted session may hold remote state it could not apply, so it is not saved
bool WizardController::can_persist() const {
    return state_ == WizardState::Active || state_ == WizardState::AwaitingReauth;
}

void WizardController::set_state(WizardState state) {
    if (state_ == state) {
        return;
    }
    spdlog::debug("[WizardController] State {} -> {}", wizard_state_name(state_),
                  wizard_state_name(state));
    state_ = state;
    if (listener_) {
        listener_->on_state_changed(state_);
    }
}

void WizardController::set_busy(bool busy) {
    if (busy_ == busy) {
        return;
    }
    busy_ = busy;
    if (listener_) {
        listener_->on_busy_changed(busy_);
    }
}

void WizardController::settle() {
    set_busy(false);
    if (!save_pending_) {
        return;
    }

    save_pending_ = false;
    auto callbacks = std::move(pending_save_callbacks_);
    pending_save_callbacks_.clear();

    std::string id;
    DraftSaveStatus status = DraftSaveStatus::InvalidState;
    if (can_persist()) {
        status = persist(id);
    } else {
        spdlog::debug("[WizardController] Deferred draft save dropped in state {}",
                      wizard_state_name(state_));
    }

    for (auto& cb : callbacks) {
        if (cb) {
            cb(status, id);
        }
    }
}

void WizardController::notify_step_changed() {
    if (listener_) {
        listener_->on_step_changed(navigator_->current(), navigator_->current_step());
    }
}

} // namespace waypoint
