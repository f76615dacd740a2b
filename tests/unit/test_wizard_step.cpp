// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_wizard_step.cpp
 * @brief StepCompletion delivery rules and the guarded WizardStep::commit()
 */

#include "wizard_step.h"

#include <atomic>
#include <memory>
#include <vector>

#include "../test_helpers/wizard_test_steps.h"

#include <catch2/catch_test_macros.hpp>

using namespace waypoint;
using waypoint_test::CountingStep;

namespace {

std::shared_ptr<std::atomic<bool>> make_alive() {
    return std::make_shared<std::atomic<bool>>(true);
}

} // namespace

// ============================================================================
// StepCompletion
// ============================================================================

TEST_CASE("StepCompletion: delivers only the first outcome", "[wizard_step][completion]") {
    std::vector<OutcomeKind> seen;
    StepCompletion done(make_alive(), [&](const StepOutcome& o) { seen.push_back(o.kind); });

    REQUIRE_FALSE(done.cancelled());
    done(StepOutcome::advance());
    done(StepOutcome::fatal(WizardError::internal("late", "x")));

    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0] == OutcomeKind::Advance);
    REQUIRE(done.cancelled());
}

TEST_CASE("StepCompletion: copies share the fired state", "[wizard_step][completion]") {
    int calls = 0;
    StepCompletion done(make_alive(), [&](const StepOutcome&) { ++calls; });
    StepCompletion copy = done;

    copy(StepOutcome::advance());
    done(StepOutcome::advance());

    REQUIRE(calls == 1);
}

TEST_CASE("StepCompletion: dead session drops the outcome", "[wizard_step][completion]") {
    auto alive = make_alive();
    int calls = 0;
    StepCompletion done(alive, [&](const StepOutcome&) { ++calls; });

    alive->store(false);

    REQUIRE(done.cancelled());
    done(StepOutcome::advance());
    REQUIRE(calls == 0);
}

TEST_CASE("StepCompletion: null alive flag counts as cancelled", "[wizard_step][completion]") {
    int calls = 0;
    StepCompletion done(nullptr, [&](const StepOutcome&) { ++calls; });

    REQUIRE(done.cancelled());
    done(StepOutcome::advance());
    REQUIRE(calls == 0);
}

// ============================================================================
// WizardStep lifecycle
// ============================================================================

TEST_CASE("WizardStep: initialize runs setup once", "[wizard_step]") {
    CountingStep step("a");
    REQUIRE_FALSE(step.is_initialized());

    step.initialize();
    step.initialize();

    REQUIRE(step.is_initialized());
    REQUIRE(step.setup_calls == 1);
}

TEST_CASE("WizardStep: title falls back to id", "[wizard_step]") {
    CountingStep step("household");
    REQUIRE(step.title() == "household");
    REQUIRE(step.status() == StepStatus::NotStarted);
}

// ============================================================================
// Guarded commit
// ============================================================================

TEST_CASE("WizardStep: commit marks the guard on advance", "[wizard_step][commit]") {
    CountingStep step("unit");
    WizardContext ctx;
    IdempotencyGuard guard;
    std::vector<OutcomeKind> seen;

    step.commit(ctx, guard, StepCompletion(make_alive(), [&](const StepOutcome& o) {
                    seen.push_back(o.kind);
                }));

    REQUIRE(step.next_calls == 1);
    REQUIRE(guard.has_committed("unit"));
    REQUIRE(seen == std::vector<OutcomeKind>{OutcomeKind::Advance});
}

TEST_CASE("WizardStep: committed step skips on_next", "[wizard_step][commit]") {
    CountingStep step("unit");
    WizardContext ctx;
    IdempotencyGuard guard;
    guard.mark_committed("unit");
    int advances = 0;

    step.commit(ctx, guard, StepCompletion(make_alive(), [&](const StepOutcome& o) {
                    if (o.kind == OutcomeKind::Advance) {
                        ++advances;
                    }
                }));

    REQUIRE(step.next_calls == 0);
    REQUIRE(advances == 1);
}

TEST_CASE("WizardStep: retry outcome leaves the guard unset", "[wizard_step][commit]") {
    CountingStep step("unit");
    step.outcome = OutcomeKind::RetryWithErrors;
    WizardContext ctx;
    IdempotencyGuard guard;
    StepOutcome last;

    step.commit(ctx, guard, StepCompletion(make_alive(), [&](const StepOutcome& o) { last = o; }));

    REQUIRE(last.kind == OutcomeKind::RetryWithErrors);
    REQUIRE(last.error.kind == WizardErrorKind::Transient);
    REQUIRE_FALSE(guard.has_committed("unit"));

    // A retry runs on_next again
    step.outcome = OutcomeKind::Advance;
    step.commit(ctx, guard, StepCompletion(make_alive(), [&](const StepOutcome& o) { last = o; }));
    REQUIRE(step.next_calls == 2);
    REQUIRE(guard.has_committed("unit"));
}

TEST_CASE("WizardStep: exception from on_next becomes a fatal internal error",
          "[wizard_step][commit]") {
    CountingStep step("unit");
    step.throw_on_next = true;
    WizardContext ctx;
    IdempotencyGuard guard;
    StepOutcome last;

    step.commit(ctx, guard, StepCompletion(make_alive(), [&](const StepOutcome& o) { last = o; }));

    REQUIRE(last.kind == OutcomeKind::Fatal);
    REQUIRE(last.error.kind == WizardErrorKind::Internal);
    REQUIRE(last.error.step_id == "unit");
    REQUIRE_FALSE(guard.has_committed("unit"));
}

TEST_CASE("WizardStep: committed fatal outcome marks the guard", "[wizard_step][commit]") {
    CountingStep step("unit");
    step.hold = true;
    WizardContext ctx;
    IdempotencyGuard guard;
    StepOutcome last;

    step.commit(ctx, guard, StepCompletion(make_alive(), [&](const StepOutcome& o) { last = o; }));
    step.release(StepOutcome::committed_fatal(WizardError::internal("apply failed", "unit")));

    REQUIRE(last.kind == OutcomeKind::Fatal);
    REQUIRE(guard.has_committed("unit"));
    REQUIRE_FALSE(StepOutcome::fatal(WizardError::internal("x", "unit")).committed);
    REQUIRE_FALSE(step.has_remote_effect());
}

TEST_CASE("WizardStep: late completion after session ends does not mark the guard",
          "[wizard_step][commit]") {
    CountingStep step("unit");
    step.hold = true;
    WizardContext ctx;
    IdempotencyGuard guard;
    auto alive = make_alive();
    int calls = 0;

    step.commit(ctx, guard, StepCompletion(alive, [&](const StepOutcome&) { ++calls; }));
    REQUIRE(step.has_held());

    alive->store(false);
    step.release(StepOutcome::advance());

    REQUIRE(calls == 0);
    REQUIRE_FALSE(guard.has_committed("unit"));
}
