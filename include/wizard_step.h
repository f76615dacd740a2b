// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file wizard_step.h
 * @brief Contract implemented by every wizard step
 *
 * Lifecycle, driven by StepNavigator:
 *
 *   initialize()  -> setup() once, before first activation
 *   on_show()     -> every activation; pull context into local editable copy
 *   validate()    -> pure check of local data against the context
 *   commit()      -> guarded forward transition, calls on_next() at most once
 *                    per committed session
 *   on_hide()     -> leaving the step in either direction; bookkeeping only
 *
 * Status: NotStarted -> Active (first show) -> Completed (commit advanced).
 * Going back to a Completed step makes it Active again; its guard flag and the
 * context values it committed are untouched.
 */

#include "idempotency_guard.h"
#include "remote_error.h"
#include "wizard_context.h"
#include "wizard_types.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "hv/json.hpp"

namespace waypoint {

/// Tri-state result of a forward transition attempt
enum class OutcomeKind {
    Advance,
    RetryWithErrors,
    Fatal,
};

const char* outcome_kind_name(OutcomeKind kind);

struct StepOutcome {
    OutcomeKind kind = OutcomeKind::Advance;
    WizardError error;      ///< Set for RetryWithErrors and Fatal
    bool committed = false; ///< Fatal raised after the remote side already applied the step

    static StepOutcome advance() {
        return StepOutcome{};
    }

    static StepOutcome retry(WizardError err) {
        return StepOutcome{OutcomeKind::RetryWithErrors, std::move(err)};
    }

    static StepOutcome fatal(WizardError err) {
        return StepOutcome{OutcomeKind::Fatal, std::move(err)};
    }

    /// Fatal after a successful remote call; the step must never be re-sent
    static StepOutcome committed_fatal(WizardError err) {
        return StepOutcome{OutcomeKind::Fatal, std::move(err), true};
    }
};

/**
 * @brief Single-shot completion handle passed to WizardStep::on_next()
 *
 * Shares the owning session's alive flag. Once the session is cancelled,
 * reset or destroyed, cancelled() turns true and invoking the handle does
 * nothing. Steps must check cancelled() before applying a late remote
 * response to the context.
 *
 * Copies share state; only the first invocation is delivered.
 */
class StepCompletion {
  public:
    using Handler = std::function<void(const StepOutcome&)>;

    StepCompletion(std::shared_ptr<std::atomic<bool>> alive, Handler handler);

    /// True if the session is gone or the outcome was already delivered
    bool cancelled() const;

    void operator()(const StepOutcome& outcome) const;

    /// Alive flag, for chaining a nested completion onto the same session
    const std::shared_ptr<std::atomic<bool>>& alive() const;

  private:
    struct State {
        std::shared_ptr<std::atomic<bool>> alive;
        Handler handler;
        std::atomic<bool> fired{false};
    };
    std::shared_ptr<State> state_;
};

class WizardStep {
  public:
    explicit WizardStep(std::string id, std::string title = "");
    virtual ~WizardStep() = default;

    WizardStep(const WizardStep&) = delete;
    WizardStep& operator=(const WizardStep&) = delete;

    const std::string& id() const {
        return id_;
    }

    const std::string& title() const {
        return title_.empty() ? id_ : title_;
    }

    StepStatus status() const {
        return status_;
    }

    /// Run setup() if it has not run yet
    void initialize();

    bool is_initialized() const {
        return initialized_;
    }

    /**
     * @brief Guarded forward transition
     *
     * If the guard already holds this step's flag, on_next() is not called and
     * Advance is reported immediately. Otherwise on_next() runs; an Advance
     * or committed Fatal outcome marks the guard. Exceptions escaping
     * on_next() become Fatal.
     */
    void commit(WizardContext& ctx, IdempotencyGuard& guard, StepCompletion done);

    /// Pull required values from the context into the local editable copy
    virtual void on_show(const WizardContext& ctx) = 0;

    /// Pure validation; no I/O, same inputs give the same result
    virtual ValidationResult validate(const WizardContext& ctx) const = 0;

    /// Bookkeeping on exit in either direction. No remote calls.
    virtual void on_hide(const WizardContext& /*ctx*/) {}

    /// Current local editable data
    virtual nlohmann::json collect_data() const = 0;

    /// Re-apply local data saved in a draft
    virtual void restore_data(const nlohmann::json& /*data*/) {}

    /// Drop local edits (explicit wizard reset)
    virtual void clear_data() {}

    /// True if committing this step creates state on a remote service
    virtual bool has_remote_effect() const {
        return false;
    }

  protected:
    /// One-time, side-effect free preparation
    virtual void setup() {}

    /**
     * @brief Side-effecting work of the step
     *
     * Only called while this step's guard flag is False. Must invoke done
     * exactly once, possibly after returning.
     */
    virtual void on_next(WizardContext& ctx, StepCompletion done) = 0;

  private:
    friend class StepNavigator;

    void set_status(StepStatus status);

    std::string id_;
    std::string title_;
    StepStatus status_ = StepStatus::NotStarted;
    bool initialized_ = false;
};

} // namespace waypoint
