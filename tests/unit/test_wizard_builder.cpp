// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wizard_builder.h"

#include <memory>

#include "../mocks/mock_remote_step_service.h"
#include "../test_helpers/wizard_test_steps.h"

#include <catch2/catch_test_macros.hpp>

using namespace waypoint;
using waypoint_test::CountingStep;

TEST_CASE("WizardBuilder: builds steps in insertion order", "[wizard_builder]") {
    auto seq = WizardBuilder()
                   .emplace<CountingStep>("first")
                   .emplace<CountingStep>("second")
                   .emplace<CountingStep>("third")
                   .build();

    REQUIRE(seq->size() == 3);
    REQUIRE(seq->at(0).id() == "first");
    REQUIRE(seq->at(2).id() == "third");
    REQUIRE(seq->index_of("second") == 1);
    REQUIRE_FALSE(seq->index_of("fourth").has_value());
}

TEST_CASE("WizardBuilder: defaults to a local finish", "[wizard_builder]") {
    auto seq = WizardBuilder().emplace<CountingStep>("only").build();

    REQUIRE(seq->finish_service() == nullptr);
    REQUIRE(seq->finish_operation() == "finish");
    REQUIRE(seq->reference_prefix() == "WIZ");
}

TEST_CASE("WizardBuilder: carries finish service and reference prefix", "[wizard_builder]") {
    auto api = std::make_shared<MockRemoteStepService>();
    auto seq = WizardBuilder()
                   .reference_prefix("SRV")
                   .emplace<CountingStep>("only")
                   .finish_with(api, "finalize_survey")
                   .build();

    REQUIRE(seq->finish_service() == api);
    REQUIRE(seq->finish_operation() == "finalize_survey");
    REQUIRE(seq->reference_prefix() == "SRV");
}

TEST_CASE("WizardBuilder: empty finish operation name falls back to finish",
          "[wizard_builder]") {
    auto seq = WizardBuilder()
                   .emplace<CountingStep>("only")
                   .finish_with(std::make_shared<MockRemoteStepService>(), "")
                   .build();
    REQUIRE(seq->finish_operation() == "finish");
}

TEST_CASE("WizardBuilder: rejects invalid sequences", "[wizard_builder]") {
    SECTION("no steps") {
        REQUIRE_THROWS_AS(WizardBuilder().build(), std::invalid_argument);
    }
    SECTION("null step") {
        WizardBuilder builder;
        REQUIRE_THROWS_AS(builder.add(nullptr), std::invalid_argument);
    }
    SECTION("duplicate ids") {
        WizardBuilder builder;
        builder.emplace<CountingStep>("unit").emplace<CountingStep>("unit");
        REQUIRE_THROWS_AS(builder.build(), std::invalid_argument);
    }
    SECTION("empty id") {
        WizardBuilder builder;
        builder.emplace<CountingStep>("");
        REQUIRE_THROWS_AS(builder.build(), std::invalid_argument);
    }
    SECTION("reserved finish id") {
        WizardBuilder builder;
        builder.emplace<CountingStep>(IdempotencyGuard::FINISH_KEY);
        REQUIRE_THROWS_AS(builder.build(), std::invalid_argument);
    }
}

TEST_CASE("WizardBuilder: builder is empty after build", "[wizard_builder]") {
    WizardBuilder builder;
    builder.reference_prefix("SRV").emplace<CountingStep>("only");
    auto seq = builder.build();

    REQUIRE(seq->size() == 1);
    REQUIRE_THROWS_AS(builder.build(), std::invalid_argument);
}
