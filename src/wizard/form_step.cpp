// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "form_step.h"

#include "json_utils.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

using json = nlohmann::json;

namespace waypoint {

FormStep::FormStep(FormStepConfig config)
    : WizardStep(config.id, config.title), config_(std::move(config)) {
    for (const auto& field_spec : config_.fields) {
        values_[field_spec.name] = nullptr;
    }
}

const FieldSpec* FormStep::find_field(const std::string& name) const {
    for (const auto& field_spec : config_.fields) {
        if (field_spec.name == name) {
            return &field_spec;
        }
    }
    return nullptr;
}

void FormStep::set_field(const std::string& name, json value) {
    if (!find_field(name)) {
        throw std::invalid_argument("Step '" + id() + "' has no field '" + name + "'");
    }
    values_[name] = std::move(value);
    edited_.insert(name);
}

json FormStep::field(const std::string& name) const {
    return values_.contains(name) ? values_[name] : json();
}

void FormStep::on_show(const WizardContext& ctx) {
    size_t pulled = 0;
    for (const auto& field_spec : config_.fields) {
        if (field_spec.context_key.empty() || edited_.count(field_spec.name) > 0) {
            continue;
        }
        if (ctx.contains(field_spec.context_key)) {
            values_[field_spec.name] = ctx.get(field_spec.context_key);
            ++pulled;
        }
    }
    spdlog::trace("[FormStep] {} shown, pulled {} field(s) from context", id(), pulled);
}

ValidationResult FormStep::validate(const WizardContext& ctx) const {
    ValidationResult result;

    for (const auto& key : config_.required_context) {
        if (!ctx.contains(key)) {
            result.add_error(key, "Missing '" + key + "' from an earlier step");
        } else if (!ctx.is_finalized(key)) {
            result.add_error(key, "'" + key + "' has not been confirmed by an earlier step");
        }
    }

    for (const auto& field_spec : config_.fields) {
        const json value = field(field_spec.name);
        if (json_util::is_blank(value)) {
            if (field_spec.required) {
                result.add_error(field_spec.name, field_spec.name + " is required");
            }
            continue;
        }
        if (field_spec.validator) {
            if (auto message = field_spec.validator(value)) {
                result.add_error(field_spec.name, *message);
            }
        }
    }
    return result;
}

json FormStep::collect_data() const {
    return values_;
}

void FormStep::restore_data(const json& data) {
    if (!data.is_object()) {
        return;
    }
    for (const auto& field_spec : config_.fields) {
        if (data.contains(field_spec.name) && !data[field_spec.name].is_null()) {
            values_[field_spec.name] = data[field_spec.name];
            edited_.insert(field_spec.name);
        }
    }
}

void FormStep::clear_data() {
    for (const auto& field_spec : config_.fields) {
        values_[field_spec.name] = nullptr;
    }
    edited_.clear();
}

void FormStep::write_fields(WizardContext& ctx) const {
    for (const auto& field_spec : config_.fields) {
        if (field_spec.context_key.empty()) {
            continue;
        }
        const json value = field(field_spec.name);
        if (ctx.is_finalized(field_spec.context_key) && ctx.get(field_spec.context_key) == value) {
            continue;
        }
        ctx.set(field_spec.context_key, value);
        if (field_spec.finalize) {
            ctx.mark_finalized(field_spec.context_key);
        }
    }
}

void FormStep::on_next(WizardContext& ctx, StepCompletion done) {
    write_fields(ctx);
    done(StepOutcome::advance());
}

} // namespace waypoint
