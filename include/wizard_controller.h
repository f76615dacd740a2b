// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file wizard_controller.h
 * @brief Session-level commands for a wizard
 *
 * Owns one WizardContext, one IdempotencyGuard and the StepNavigator over an
 * immutable StepSequence. All commands must be issued from the owner thread;
 * asynchronous step completions are expected to arrive on that thread too
 * (see CompletionQueue).
 *
 * State machine:
 *
 *   NotStarted --start--> Active --finish ok--> Completed
 *                           |  ^
 *             auth failure  |  | notify_reauthenticated()
 *                           v  |
 *                       AwaitingReauth
 *
 *   Active --fatal outcome--> Halted
 *   any started state --cancel--> Cancelled
 *   reset()/start() from a finished session -> Active at step 0
 *
 * At most one remote operation is outstanding at a time. While busy, next(),
 * previous(), finish(), load_draft() and reset() report Busy; save_draft() is
 * deferred until the call settles; cancel() is always accepted.
 */

#include "draft_store.h"
#include "idempotency_guard.h"
#include "step_navigator.h"
#include "wizard_builder.h"
#include "wizard_context.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "hv/json.hpp"

namespace waypoint {

enum class WizardState {
    NotStarted,
    Active,
    AwaitingReauth, ///< Auth failure; navigation blocked
    Halted,         ///< Fatal step outcome; only save_draft/cancel/reset remain
    Completed,
    Cancelled,
};

const char* wizard_state_name(WizardState state);

enum class CommandStatus {
    Accepted,       ///< Command ran or is in flight; results go to the listener
    NoOp,           ///< Nothing to do (previous() at step 0)
    Busy,           ///< A remote operation is outstanding
    ReauthRequired, ///< Blocked until notify_reauthenticated()
    NotReady,       ///< finish() before the last step committed
    InvalidState,   ///< Not allowed in the current WizardState
};

const char* command_status_name(CommandStatus status);

enum class DraftSaveStatus {
    Saved,
    Deferred, ///< Runs once the outstanding remote call settles
    NoStore,
    InvalidState,
    Failed,
};

const char* draft_save_status_name(DraftSaveStatus status);

enum class DraftLoadStatus {
    Loaded,
    NoStore,
    Busy,
    NotFound,
    AlreadyCompleted,
    OutOfRange, ///< Saved index does not fit this step sequence
    Malformed,  ///< Snapshot or guard flags do not match this wizard
    Blocked,    ///< Session is AwaitingReauth or Halted; reset() or re-auth first
};

const char* draft_load_status_name(DraftLoadStatus status);

enum class CancelResult {
    Cancelled,
    ConfirmationRequired, ///< Remote state exists; call cancel(true) to proceed
    InvalidState,
};

/**
 * @brief Presentation boundary
 *
 * All methods have empty defaults so observers override only what they need.
 * Callbacks run on the owner thread and may issue new commands.
 */
class WizardListener {
  public:
    virtual ~WizardListener() = default;

    virtual void on_state_changed(WizardState /*state*/) {}
    virtual void on_step_changed(size_t /*index*/, const WizardStep& /*step*/) {}
    virtual void on_validation_failed(const std::string& /*step_id*/,
                                      const ValidationResult& /*result*/) {}
    virtual void on_error(const WizardError& /*error*/) {}
    virtual void on_busy_changed(bool /*busy*/) {}
    virtual void on_draft_saved(const std::string& /*draft_id*/) {}
    virtual void on_completed(const nlohmann::json& /*final_snapshot*/) {}
    virtual void on_cancelled() {}
};

struct WizardControllerOptions {
    bool delete_draft_on_finish = false;
    bool delete_draft_on_cancel = false;
};

class WizardController {
  public:
    using SaveCallback = std::function<void(DraftSaveStatus status, const std::string& draft_id)>;

    /**
     * @param steps Sequence produced by WizardBuilder (must not be null)
     * @param drafts Optional draft persistence
     * @throws std::invalid_argument if steps is null
     */
    explicit WizardController(std::unique_ptr<StepSequence> steps,
                              std::shared_ptr<DraftStore> drafts = nullptr,
                              WizardControllerOptions options = {});
    ~WizardController();

    WizardController(const WizardController&) = delete;
    WizardController& operator=(const WizardController&) = delete;

    /// Observer, not owned. Pass nullptr to detach.
    void set_listener(WizardListener* listener) {
        listener_ = listener;
    }

    /// Begin a fresh session at step 0 (from NotStarted, Completed or Cancelled)
    CommandStatus start();

    CommandStatus next();
    CommandStatus previous();

    /// Wizard-level completion; also triggered by next() on the last step
    CommandStatus finish();

    CancelResult cancel(bool confirmed = false);

    /**
     * @brief Persist the session
     *
     * @param done Receives the final status and the draft id; called before
     *             return unless the save is Deferred
     */
    DraftSaveStatus save_draft(SaveCallback done = nullptr);

    /// Refused while AwaitingReauth or Halted so a draft never lifts either halt
    DraftLoadStatus load_draft(const std::string& draft_id);

    /// Discard context and guard flags, return to step 0
    CommandStatus reset();

    /// Lift the auth halt so the failed command can be retried
    CommandStatus notify_reauthenticated();

    WizardState state() const {
        return state_;
    }

    bool is_busy() const {
        return busy_;
    }

    size_t current_index() const {
        return navigator_->current();
    }

    size_t step_count() const {
        return steps_->size();
    }

    WizardStep& current_step() {
        return navigator_->current_step();
    }

    /// Step by id, or nullptr
    WizardStep* find_step(const std::string& step_id);

    const WizardContext& context() const {
        return context_;
    }

    const IdempotencyGuard& guard() const {
        return guard_;
    }

    const StepNavigator& navigator() const {
        return *navigator_;
    }

    /// Id of the draft this session was saved to or loaded from; empty if none
    const std::string& draft_id() const {
        return draft_id_;
    }

    /// Most recent surfaced error; cleared on successful navigation
    const WizardError& last_error() const {
        return last_error_;
    }

  private:
    void begin_session();
    void discard_session();
    void invalidate_pending();

    void handle_nav_outcome(const NavOutcome& outcome);
    void run_finish();
    void handle_finish_outcome(const StepOutcome& outcome);
    void complete();
    void fail(const WizardError& error, bool fatal);
    size_t remote_commits() const;
    bool can_persist() const;

    DraftRecord build_record(bool completed) const;
    DraftSaveStatus persist(std::string& saved_id);

    void set_state(WizardState state);
    void set_busy(bool busy);
    void settle();
    void notify_step_changed();

    std::unique_ptr<StepSequence> steps_;
    std::shared_ptr<DraftStore> drafts_;
    WizardControllerOptions options_;
    WizardListener* listener_ = nullptr;

    WizardContext context_;
    IdempotencyGuard guard_;
    std::unique_ptr<StepNavigator> navigator_;

    WizardState state_ = WizardState::NotStarted;
    bool busy_ = false;
    WizardError last_error_;

    std::string draft_id_;
    std::string draft_created_at_;
    bool save_pending_ = false;
    std::vector<SaveCallback> pending_save_callbacks_;

    // Shared with every StepCompletion of the current session; replaced on
    // cancel/reset/load so late responses from the old session are dropped.
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace waypoint
