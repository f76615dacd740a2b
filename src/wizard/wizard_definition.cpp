// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wizard_definition.h"

#include "form_step.h"
#include "json_utils.h"
#include "remote_form_step.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>

using json = nlohmann::json;

namespace waypoint {

namespace {

FieldDefinition parse_field(const json& j, const std::string& step_id) {
    if (!j.is_object()) {
        throw std::invalid_argument("Step '" + step_id + "': field entries must be objects");
    }

    FieldDefinition field;
    field.name = json_util::safe_string(j, "name");
    if (field.name.empty()) {
        throw std::invalid_argument("Step '" + step_id + "': field without a name");
    }
    field.required = json_util::safe_bool(j, "required", false);
    field.context_key =
        j.contains("context_key") ? json_util::safe_string(j, "context_key") : field.name;
    field.finalize = json_util::safe_bool(j, "finalize", true);
    field.pattern = json_util::safe_string(j, "pattern");
    field.message = json_util::safe_string(j, "message");

    if (!field.pattern.empty()) {
        try {
            std::regex check(field.pattern);
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("Step '" + step_id + "', field '" + field.name +
                                        "': invalid pattern: " + e.what());
        }
    }
    return field;
}

StepDefinition parse_step(const json& j, size_t index) {
    if (!j.is_object()) {
        throw std::invalid_argument("Step #" + std::to_string(index) + " is not an object");
    }

    StepDefinition step;
    step.id = json_util::safe_string(j, "id");
    if (step.id.empty()) {
        throw std::invalid_argument("Step #" + std::to_string(index) + " has no id");
    }
    step.title = json_util::safe_string(j, "title", step.id);
    step.operation = json_util::safe_string(j, "operation");
    step.required_context = json_util::string_list(j, "requires");
    step.expected_identifiers = json_util::string_list(j, "expected_identifiers");

    if (j.contains("fields")) {
        if (!j["fields"].is_array()) {
            throw std::invalid_argument("Step '" + step.id + "': fields must be an array");
        }
        for (const auto& f : j["fields"]) {
            step.fields.push_back(parse_field(f, step.id));
        }
    }
    return step;
}

FieldValidator make_pattern_validator(const FieldDefinition& field) {
    auto re = std::make_shared<std::regex>(field.pattern);
    std::string message =
        field.message.empty() ? field.name + " has an invalid format" : field.message;
    return [re, message](const json& value) -> std::optional<std::string> {
        std::string text = value.is_string() ? value.get<std::string>() : value.dump();
        if (std::regex_search(text, *re)) {
            return std::nullopt;
        }
        return message;
    };
}

FormStepConfig to_form_config(const StepDefinition& def) {
    FormStepConfig config;
    config.id = def.id;
    config.title = def.title;
    config.required_context = def.required_context;
    for (const auto& f : def.fields) {
        FieldSpec field_spec;
        field_spec.name = f.name;
        field_spec.required = f.required;
        field_spec.context_key = f.context_key;
        field_spec.finalize = f.finalize;
        if (!f.pattern.empty()) {
            field_spec.validator = make_pattern_validator(f);
        }
        config.fields.push_back(std::move(field_spec));
    }
    return config;
}

} // namespace

WizardDefinition WizardDefinition::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Wizard definition must be a JSON object");
    }
    if (!j.contains("steps") || !j["steps"].is_array() || j["steps"].empty()) {
        throw std::invalid_argument("Wizard definition needs a non-empty 'steps' array");
    }

    WizardDefinition def;
    def.reference_prefix_ = json_util::safe_string(j, "reference_prefix", "WIZ");

    size_t index = 0;
    for (const auto& s : j["steps"]) {
        def.steps_.push_back(parse_step(s, index++));
    }

    if (j.contains("finish") && j["finish"].is_object()) {
        def.finish_operation_ = json_util::safe_string(j["finish"], "operation");
    }

    spdlog::debug("[WizardDefinition] Parsed {} step(s), prefix {}, finish '{}'",
                  def.steps_.size(), def.reference_prefix_, def.finish_operation_);
    return def;
}

WizardDefinition WizardDefinition::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw std::runtime_error("Cannot open wizard definition " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + path + ": " + e.what());
    }
    return from_json(j);
}

bool WizardDefinition::has_remote_steps() const {
    for (const auto& step : steps_) {
        if (!step.operation.empty()) {
            return true;
        }
    }
    return false;
}

std::unique_ptr<StepSequence>
WizardDefinition::build(std::shared_ptr<RemoteStepService> service) const {
    if (!service && (has_remote_steps() || !finish_operation_.empty())) {
        throw std::invalid_argument("Wizard definition has remote operations but no service");
    }

    WizardBuilder builder;
    builder.reference_prefix(reference_prefix_);

    for (const auto& step : steps_) {
        if (step.operation.empty()) {
            builder.emplace<FormStep>(to_form_config(step));
        } else {
            builder.emplace<RemoteFormStep>(to_form_config(step), service, step.operation,
                                            step.expected_identifiers);
        }
    }

    if (!finish_operation_.empty()) {
        builder.finish_with(service, finish_operation_);
    }
    return builder.build();
}

} // namespace waypoint
