// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_form_step.cpp
 * @brief FormStep field handling and RemoteFormStep request/response mapping
 */

#include "form_step.h"
#include "remote_form_step.h"

#include <atomic>
#include <memory>
#include <optional>

#include "../mocks/mock_remote_step_service.h"
#include "../test_helpers/wizard_test_steps.h"
#include "hv/json.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace waypoint;
using namespace waypoint_test;
using json = nlohmann::json;

namespace {

struct CommitResult {
    std::optional<StepOutcome> outcome;
};

/// Run the guarded commit and capture whatever arrives
void run_commit(WizardStep& step, WizardContext& ctx, IdempotencyGuard& guard,
                CommitResult& result) {
    auto alive = std::make_shared<std::atomic<bool>>(true);
    step.commit(ctx, guard,
                StepCompletion(alive, [&result](const StepOutcome& o) { result.outcome = o; }));
}

void seed_building(WizardContext& ctx) {
    ctx.set("building_id", "B1");
    ctx.mark_finalized("building_id");
}

} // namespace

// ============================================================================
// FormStep: editing and validation
// ============================================================================

TEST_CASE("FormStep: fields start null and record edits", "[form_step]") {
    FormStep step(building_config());

    REQUIRE(step.field("building_id").is_null());
    REQUIRE_FALSE(step.is_edited("building_id"));

    step.set_field("building_id", "B1");
    REQUIRE(step.field("building_id") == "B1");
    REQUIRE(step.is_edited("building_id"));
}

TEST_CASE("FormStep: undeclared field is rejected", "[form_step]") {
    FormStep step(building_config());
    REQUIRE_THROWS_AS(step.set_field("colour", "red"), std::invalid_argument);
}

TEST_CASE("FormStep: required fields must be filled", "[form_step][validation]") {
    FormStep step(building_config());
    WizardContext ctx;

    auto result = step.validate(ctx);
    REQUIRE_FALSE(result.valid);
    REQUIRE(result.errors.size() == 1);
    REQUIRE(result.errors[0].field == "building_id");

    step.set_field("building_id", "   ");
    REQUIRE(step.validate(ctx).valid); // whitespace is a value; only empty counts as blank

    step.set_field("building_id", "");
    REQUIRE_FALSE(step.validate(ctx).valid);
}

TEST_CASE("FormStep: validator message is reported for its field", "[form_step][validation]") {
    FormStepConfig cfg;
    cfg.id = "contact";
    FieldSpec phone;
    phone.name = "phone";
    phone.validator = [](const json& v) -> std::optional<std::string> {
        if (v.is_string() && v.get<std::string>().size() >= 7) {
            return std::nullopt;
        }
        return std::string("phone is too short");
    };
    cfg.fields.push_back(phone);
    FormStep step(cfg);
    WizardContext ctx;

    // Optional and blank: validator is not consulted
    REQUIRE(step.validate(ctx).valid);

    step.set_field("phone", "123");
    auto result = step.validate(ctx);
    REQUIRE_FALSE(result.valid);
    REQUIRE(result.errors[0] == (FieldError{"phone", "phone is too short"}));

    step.set_field("phone", "5551234");
    REQUIRE(step.validate(ctx).valid);
}

TEST_CASE("FormStep: required context must be finalized by an earlier step",
          "[form_step][validation]") {
    FormStep step(unit_config());
    step.set_field("unit_number", "12");
    WizardContext ctx;

    auto missing = step.validate(ctx);
    REQUIRE_FALSE(missing.valid);
    REQUIRE(missing.errors[0].field == "building_id");

    ctx.set("building_id", "B1");
    REQUIRE_FALSE(step.validate(ctx).valid);

    ctx.mark_finalized("building_id");
    REQUIRE(step.validate(ctx).valid);
}

TEST_CASE("FormStep: validate is repeatable", "[form_step][validation]") {
    FormStep step(unit_config());
    WizardContext ctx;
    REQUIRE(step.validate(ctx) == step.validate(ctx));
}

// ============================================================================
// FormStep: context interaction
// ============================================================================

TEST_CASE("FormStep: on_show pulls context without clobbering edits", "[form_step]") {
    FormStep step(household_config());
    WizardContext ctx;
    ctx.set("head_of_household", "Ada");
    ctx.set("members", 3);

    step.set_field("members", 4);
    step.on_show(ctx);

    REQUIRE(step.field("head_of_household") == "Ada");
    REQUIRE(step.field("members") == 4);
}

TEST_CASE("FormStep: commit writes bound fields and finalizes them", "[form_step][commit]") {
    FormStep step(unit_config());
    WizardContext ctx;
    IdempotencyGuard guard;
    seed_building(ctx);
    step.set_field("unit_number", "12");
    step.set_field("notes", "corner");

    CommitResult result;
    run_commit(step, ctx, guard, result);

    REQUIRE(result.outcome.has_value());
    REQUIRE(result.outcome->kind == OutcomeKind::Advance);
    REQUIRE(ctx.get("unit_number") == "12");
    REQUIRE(ctx.is_finalized("unit_number"));
    REQUIRE_FALSE(ctx.contains("notes")); // local-only field
    REQUIRE(guard.has_committed("unit"));
}

TEST_CASE("FormStep: unfinalized binding stays editable in the context", "[form_step][commit]") {
    FormStep step(household_config());
    WizardContext ctx;
    IdempotencyGuard guard;
    ctx.set("unit_id", "U1");
    ctx.mark_finalized("unit_id");
    step.set_field("head_of_household", "Ada");
    step.set_field("members", 2);

    CommitResult result;
    run_commit(step, ctx, guard, result);

    REQUIRE(result.outcome->kind == OutcomeKind::Advance);
    REQUIRE(ctx.is_finalized("head_of_household"));
    REQUIRE_FALSE(ctx.is_finalized("members"));
}

TEST_CASE("FormStep: changing a finalized slot is fatal", "[form_step][commit]") {
    FormStep step(building_config());
    WizardContext ctx;
    IdempotencyGuard guard;
    seed_building(ctx);
    step.set_field("building_id", "B2");

    CommitResult result;
    run_commit(step, ctx, guard, result);

    REQUIRE(result.outcome->kind == OutcomeKind::Fatal);
    REQUIRE(result.outcome->error.kind == WizardErrorKind::Internal);
    REQUIRE(ctx.get("building_id") == "B1");
    REQUIRE_FALSE(guard.has_committed("building"));
}

TEST_CASE("FormStep: collect, restore and clear local data", "[form_step]") {
    FormStep step(unit_config());
    step.set_field("unit_number", "12");

    json saved = step.collect_data();
    REQUIRE(saved["unit_number"] == "12");
    REQUIRE(saved["notes"].is_null());

    step.clear_data();
    REQUIRE(step.field("unit_number").is_null());
    REQUIRE_FALSE(step.is_edited("unit_number"));

    step.restore_data(saved);
    REQUIRE(step.field("unit_number") == "12");
    REQUIRE(step.is_edited("unit_number"));
    REQUIRE_FALSE(step.is_edited("notes"));
}

// ============================================================================
// RemoteFormStep
// ============================================================================

class RemoteFormStepTestFixture {
  public:
    RemoteFormStepTestFixture()
        : api_(std::make_shared<MockRemoteStepService>()),
          step_(unit_config(), api_, "create_unit", {"unit_id"}) {
        seed_building(ctx_);
        step_.set_field("unit_number", "12");
        step_.set_field("notes", "corner");
    }

  protected:
    std::shared_ptr<MockRemoteStepService> api_;
    RemoteFormStep step_;
    WizardContext ctx_{"SRV"};
    IdempotencyGuard guard_;
};

TEST_CASE("RemoteFormStep: requires a service", "[remote_form_step]") {
    REQUIRE_THROWS_AS(RemoteFormStep(unit_config(), nullptr, "create_unit"),
                      std::invalid_argument);
}

TEST_CASE("RemoteFormStep: operation defaults to the step id", "[remote_form_step]") {
    RemoteFormStep step(unit_config(), std::make_shared<MockRemoteStepService>(), "");
    REQUIRE(step.operation() == "unit");
}

TEST_CASE_METHOD(RemoteFormStepTestFixture, "RemoteFormStep: request carries fields and context",
                 "[remote_form_step]") {
    json req = step_.build_request(ctx_);

    REQUIRE(req["reference_number"] == ctx_.reference_number());
    REQUIRE(req["fields"]["unit_number"] == "12");
    REQUIRE(req["fields"]["notes"] == "corner");
    REQUIRE(req["context"] == (json{{"building_id", "B1"}}));
}

TEST_CASE_METHOD(RemoteFormStepTestFixture,
                 "RemoteFormStep: success finalizes fields and returned identifiers",
                 "[remote_form_step]") {
    api_->respond_success("create_unit", {{"unit_id", "U1"}, {"unit_url", "/units/U1"}});

    CommitResult result;
    run_commit(step_, ctx_, guard_, result);

    REQUIRE(api_->call_count("create_unit") == 1);
    REQUIRE(api_->last_payload("create_unit")["fields"]["unit_number"] == "12");
    REQUIRE(result.outcome->kind == OutcomeKind::Advance);
    REQUIRE(ctx_.get("unit_id") == "U1");
    REQUIRE(ctx_.is_finalized("unit_id"));
    REQUIRE(ctx_.is_finalized("unit_url"));
    REQUIRE(ctx_.is_finalized("unit_number"));
    REQUIRE(guard_.has_committed("unit"));
}

TEST_CASE_METHOD(RemoteFormStepTestFixture,
                 "RemoteFormStep: missing expected identifier is fatal but committed",
                 "[remote_form_step]") {
    api_->respond_success("create_unit", {{"id", "U1"}});

    CommitResult result;
    run_commit(step_, ctx_, guard_, result);

    REQUIRE(result.outcome->kind == OutcomeKind::Fatal);
    REQUIRE(result.outcome->committed);
    REQUIRE(result.outcome->error.kind == WizardErrorKind::Internal);
    REQUIRE_FALSE(ctx_.contains("unit_id"));
    REQUIRE(guard_.has_committed("unit"));

    // The mutation already happened remotely and is not sent again
    CommitResult again;
    run_commit(step_, ctx_, guard_, again);
    REQUIRE(again.outcome->kind == OutcomeKind::Advance);
    REQUIRE(api_->call_count("create_unit") == 1);
}

TEST_CASE_METHOD(RemoteFormStepTestFixture,
                 "RemoteFormStep: identifier conflicting with a finalized slot is committed",
                 "[remote_form_step]") {
    ctx_.set("unit_id", "U0");
    ctx_.mark_finalized("unit_id");
    api_->respond_success("create_unit", {{"unit_id", "U1"}});

    CommitResult result;
    run_commit(step_, ctx_, guard_, result);

    REQUIRE(result.outcome->kind == OutcomeKind::Fatal);
    REQUIRE(result.outcome->committed);
    REQUIRE(ctx_.get("unit_id") == "U0");
    REQUIRE(guard_.has_committed("unit"));
}

TEST_CASE("RemoteFormStep: reports a remote effect", "[remote_form_step]") {
    RemoteFormStep remote(unit_config(), std::make_shared<MockRemoteStepService>(), "create_unit");
    FormStep local(unit_config());

    REQUIRE(remote.has_remote_effect());
    REQUIRE_FALSE(local.has_remote_effect());
}

TEST_CASE_METHOD(RemoteFormStepTestFixture,
                 "RemoteFormStep: failure is classified and nothing is written",
                 "[remote_form_step]") {
    api_->respond_failure("create_unit", RemoteErrorCategory::Validation, "Unit rejected",
                          {FieldError{"unit_number", "Unit 12 does not exist on floor plan"}},
                          422);

    CommitResult result;
    run_commit(step_, ctx_, guard_, result);

    REQUIRE(result.outcome->kind == OutcomeKind::RetryWithErrors);
    const WizardError& err = result.outcome->error;
    REQUIRE(err.kind == WizardErrorKind::RemoteValidation);
    REQUIRE(err.step_id == "unit");
    REQUIRE(err.status_code == 422);
    REQUIRE(err.field_errors.size() == 1);
    REQUIRE(err.field_errors[0].message == "Unit 12 does not exist on floor plan");
    REQUIRE_FALSE(ctx_.contains("unit_number"));
    REQUIRE_FALSE(guard_.has_committed("unit"));
}

TEST_CASE_METHOD(RemoteFormStepTestFixture,
                 "RemoteFormStep: response after the session ends is discarded",
                 "[remote_form_step]") {
    api_->hold_responses(true);
    auto alive = std::make_shared<std::atomic<bool>>(true);
    bool delivered = false;
    step_.commit(ctx_, guard_,
                 StepCompletion(alive, [&delivered](const StepOutcome&) { delivered = true; }));
    REQUIRE(api_->pending_count() == 1);

    alive->store(false);
    REQUIRE(api_->resolve_pending());

    REQUIRE_FALSE(delivered);
    REQUIRE_FALSE(ctx_.contains("unit_id"));
    REQUIRE_FALSE(guard_.has_committed("unit"));
}
