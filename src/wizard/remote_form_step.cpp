// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "remote_form_step.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

using json = nlohmann::json;

namespace waypoint {

RemoteFormStep::RemoteFormStep(FormStepConfig config, std::shared_ptr<RemoteStepService> service,
                               std::string operation,
                               std::vector<std::string> expected_identifiers)
    : FormStep(std::move(config)), service_(std::move(service)), operation_(std::move(operation)),
      expected_identifiers_(std::move(expected_identifiers)) {
    if (!service_) {
        throw std::invalid_argument("RemoteFormStep '" + id() + "' needs a RemoteStepService");
    }
    if (operation_.empty()) {
        operation_ = id();
    }
}

json RemoteFormStep::build_request(const WizardContext& ctx) const {
    json context_values = json::object();
    for (const auto& key : config().required_context) {
        context_values[key] = ctx.get(key, json());
    }
    return json{{"reference_number", ctx.reference_number()},
                {"fields", collect_data()},
                {"context", std::move(context_values)}};
}

void RemoteFormStep::on_next(WizardContext& ctx, StepCompletion done) {
    const std::string step_id = id();
    json payload = build_request(ctx);

    spdlog::info("[RemoteFormStep] {}: executing '{}'", step_id, operation_);

    service_->execute(
        operation_, payload,
        [this, &ctx, done, step_id](const json& identifiers) {
            if (done.cancelled()) {
                spdlog::info("[RemoteFormStep] {}: response arrived after cancel, discarded",
                             step_id);
                return;
            }

            for (const auto& key : expected_identifiers_) {
                if (!identifiers.is_object() || !identifiers.contains(key)) {
                    LOG_ERROR_INTERNAL("{}: '{}' succeeded without identifier '{}'", step_id,
                                       operation_, key);
                    done(StepOutcome::committed_fatal(WizardError::internal(
                        "Server response is missing '" + key + "'", step_id)));
                    return;
                }
            }

            try {
                write_fields(ctx);
                if (identifiers.is_object()) {
                    for (auto it = identifiers.begin(); it != identifiers.end(); ++it) {
                        if (ctx.is_finalized(it.key()) && ctx.get(it.key()) == it.value()) {
                            continue;
                        }
                        ctx.set(it.key(), it.value());
                        ctx.mark_finalized(it.key());
                    }
                }
            } catch (const std::exception& e) {
                LOG_ERROR_INTERNAL("{}: failed to apply '{}' result: {}", step_id, operation_,
                                   e.what());
                done(StepOutcome::committed_fatal(WizardError::internal(e.what(), step_id)));
                return;
            }

            spdlog::info("[RemoteFormStep] {}: '{}' committed", step_id, operation_);
            done(StepOutcome::advance());
        },
        [done, step_id](const RemoteFailure& failure) {
            if (done.cancelled()) {
                spdlog::debug("[RemoteFormStep] {}: failure after cancel, discarded", step_id);
                return;
            }
            done(StepOutcome::retry(WizardError::from_remote(failure, step_id)));
        });
}

} // namespace waypoint
