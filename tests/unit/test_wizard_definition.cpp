// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wizard_definition.h"

#include "form_step.h"
#include "remote_form_step.h"
#include "wizard_context.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "../mocks/mock_remote_step_service.h"
#include "hv/json.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace waypoint;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

json survey_document() {
    return R"({
        "reference_prefix": "SRV",
        "steps": [
            {"id": "building", "title": "Building",
             "fields": [{"name": "building_id", "required": true}]},
            {"id": "unit", "operation": "create_unit",
             "requires": ["building_id"], "expected_identifiers": ["unit_id"],
             "fields": [{"name": "unit_number", "required": true,
                         "pattern": "^[0-9]+$", "message": "digits only"},
                        {"name": "notes", "context_key": ""}]},
            {"id": "household", "requires": ["unit_id"],
             "fields": [{"name": "members", "finalize": false}]}
        ],
        "finish": {"operation": "finalize_survey"}
    })"_json;
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("WizardDefinition: parses steps and fields", "[wizard_definition]") {
    WizardDefinition def = WizardDefinition::from_json(survey_document());

    REQUIRE(def.reference_prefix() == "SRV");
    REQUIRE(def.finish_operation() == "finalize_survey");
    REQUIRE(def.has_remote_steps());
    REQUIRE(def.steps().size() == 3);

    const StepDefinition& unit = def.steps()[1];
    REQUIRE(unit.id == "unit");
    REQUIRE(unit.title == "unit");
    REQUIRE(unit.operation == "create_unit");
    REQUIRE(unit.required_context == std::vector<std::string>{"building_id"});
    REQUIRE(unit.expected_identifiers == std::vector<std::string>{"unit_id"});
    REQUIRE(unit.fields.size() == 2);
    REQUIRE(unit.fields[0].context_key == "unit_number");
    REQUIRE(unit.fields[0].pattern == "^[0-9]+$");
    REQUIRE(unit.fields[1].context_key.empty());
    REQUIRE_FALSE(unit.fields[1].required);

    REQUIRE(def.steps()[0].title == "Building");
    REQUIRE_FALSE(def.steps()[2].fields[0].finalize);
}

TEST_CASE("WizardDefinition: defaults for a minimal document", "[wizard_definition]") {
    WizardDefinition def = WizardDefinition::from_json(R"({"steps": [{"id": "only"}]})"_json);

    REQUIRE(def.reference_prefix() == "WIZ");
    REQUIRE(def.finish_operation().empty());
    REQUIRE_FALSE(def.has_remote_steps());
    REQUIRE(def.steps()[0].fields.empty());
}

TEST_CASE("WizardDefinition: rejects invalid documents", "[wizard_definition]") {
    SECTION("not an object") {
        REQUIRE_THROWS_AS(WizardDefinition::from_json(json::array()), std::invalid_argument);
    }
    SECTION("no steps") {
        REQUIRE_THROWS_AS(WizardDefinition::from_json(R"({"steps": []})"_json),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(WizardDefinition::from_json(json::object()), std::invalid_argument);
    }
    SECTION("step without id") {
        REQUIRE_THROWS_AS(WizardDefinition::from_json(R"({"steps": [{"title": "x"}]})"_json),
                          std::invalid_argument);
    }
    SECTION("fields not an array") {
        json j = R"({"steps": [{"id": "a", "fields": {"name": "x"}}]})"_json;
        REQUIRE_THROWS_AS(WizardDefinition::from_json(j), std::invalid_argument);
    }
    SECTION("field without a name") {
        json j = R"({"steps": [{"id": "a", "fields": [{"required": true}]}]})"_json;
        REQUIRE_THROWS_AS(WizardDefinition::from_json(j), std::invalid_argument);
    }
    SECTION("invalid pattern") {
        json j = R"({"steps": [{"id": "a", "fields": [{"name": "x", "pattern": "(["}]}]})"_json;
        REQUIRE_THROWS_AS(WizardDefinition::from_json(j), std::invalid_argument);
    }
}

// ============================================================================
// Building
// ============================================================================

TEST_CASE("WizardDefinition: remote operations need a service", "[wizard_definition]") {
    WizardDefinition def = WizardDefinition::from_json(survey_document());
    REQUIRE_THROWS_AS(def.build(nullptr), std::invalid_argument);

    WizardDefinition finish_only = WizardDefinition::from_json(
        R"({"steps": [{"id": "a"}], "finish": {"operation": "submit"}})"_json);
    REQUIRE_THROWS_AS(finish_only.build(nullptr), std::invalid_argument);
}

TEST_CASE("WizardDefinition: local definition builds without a service", "[wizard_definition]") {
    WizardDefinition def = WizardDefinition::from_json(R"({"steps": [{"id": "only"}]})"_json);
    auto seq = def.build(nullptr);

    REQUIRE(seq->size() == 1);
    REQUIRE(seq->finish_service() == nullptr);
}

TEST_CASE("WizardDefinition: build creates form and remote steps", "[wizard_definition]") {
    auto api = std::make_shared<MockRemoteStepService>();
    auto seq = WizardDefinition::from_json(survey_document()).build(api);

    REQUIRE(seq->size() == 3);
    REQUIRE(seq->reference_prefix() == "SRV");
    REQUIRE(seq->finish_service() == api);
    REQUIRE(seq->finish_operation() == "finalize_survey");

    REQUIRE(dynamic_cast<FormStep*>(&seq->at(0)) != nullptr);
    REQUIRE(dynamic_cast<RemoteFormStep*>(&seq->at(0)) == nullptr);

    auto* unit = dynamic_cast<RemoteFormStep*>(&seq->at(1));
    REQUIRE(unit != nullptr);
    REQUIRE(unit->operation() == "create_unit");
}

TEST_CASE("WizardDefinition: pattern validator reports the configured message",
          "[wizard_definition]") {
    auto api = std::make_shared<MockRemoteStepService>();
    auto seq = WizardDefinition::from_json(survey_document()).build(api);
    auto& unit = dynamic_cast<FormStep&>(seq->at(1));

    WizardContext ctx("SRV");
    ctx.set("building_id", "B1");
    ctx.mark_finalized("building_id");

    unit.set_field("unit_number", "4B");
    ValidationResult bad = unit.validate(ctx);
    REQUIRE_FALSE(bad.valid);
    REQUIRE(bad.errors.size() == 1);
    REQUIRE(bad.errors[0].field == "unit_number");
    REQUIRE(bad.errors[0].message == "digits only");

    unit.set_field("unit_number", "12");
    REQUIRE(unit.validate(ctx).valid);
}

TEST_CASE("WizardDefinition: pattern without a message gets a generic one",
          "[wizard_definition]") {
    json j = R"({"steps": [{"id": "a",
                            "fields": [{"name": "zip", "pattern": "^[0-9]{5}$"}]}]})"_json;
    auto seq = WizardDefinition::from_json(j).build(nullptr);
    auto& step = dynamic_cast<FormStep&>(seq->at(0));

    WizardContext ctx("WIZ");
    step.set_field("zip", "abc");
    ValidationResult result = step.validate(ctx);

    REQUIRE_FALSE(result.valid);
    REQUIRE(result.errors[0].message == "zip has an invalid format");
}

// ============================================================================
// Files
// ============================================================================

TEST_CASE("WizardDefinition: load_file", "[wizard_definition]") {
    fs::path dir = fs::temp_directory_path() /
                   ("waypoint_definition_test_" +
                    std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(dir);
    fs::path path = dir / "survey.json";

    SECTION("valid file") {
        std::ofstream(path) << survey_document().dump(2);
        WizardDefinition def = WizardDefinition::load_file(path.string());
        REQUIRE(def.steps().size() == 3);
    }
    SECTION("missing file") {
        REQUIRE_THROWS_AS(WizardDefinition::load_file((dir / "absent.json").string()),
                          std::runtime_error);
    }
    SECTION("not JSON") {
        std::ofstream(path) << "steps: [building]";
        REQUIRE_THROWS_AS(WizardDefinition::load_file(path.string()), std::runtime_error);
    }
    SECTION("JSON but not a definition") {
        std::ofstream(path) << R"({"steps": 3})";
        REQUIRE_THROWS_AS(WizardDefinition::load_file(path.string()), std::invalid_argument);
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
}
