// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wizard_builder.h"

#include <spdlog/spdlog.h>

#include <set>
#include <stdexcept>

namespace waypoint {

std::optional<size_t> StepSequence::index_of(const std::string& step_id) const {
    for (size_t i = 0; i < steps_.size(); ++i) {
        if (steps_[i]->id() == step_id) {
            return i;
        }
    }
    return std::nullopt;
}

WizardBuilder& WizardBuilder::add(std::unique_ptr<WizardStep> step) {
    if (!step) {
        throw std::invalid_argument("WizardBuilder: null step");
    }
    steps_.push_back(std::move(step));
    return *this;
}

WizardBuilder& WizardBuilder::finish_with(std::shared_ptr<RemoteStepService> service,
                                          std::string operation) {
    finish_service_ = std::move(service);
    finish_operation_ = operation.empty() ? "finish" : std::move(operation);
    return *this;
}

WizardBuilder& WizardBuilder::reference_prefix(std::string prefix) {
    reference_prefix_ = std::move(prefix);
    return *this;
}

std::unique_ptr<StepSequence> WizardBuilder::build() {
    if (steps_.empty()) {
        throw std::invalid_argument("WizardBuilder: a wizard needs at least one step");
    }

    std::set<std::string> ids;
    for (const auto& step : steps_) {
        const std::string& id = step->id();
        if (id.empty()) {
            throw std::invalid_argument("WizardBuilder: step with empty id");
        }
        if (id == IdempotencyGuard::FINISH_KEY) {
            throw std::invalid_argument("WizardBuilder: step id '" + id + "' is reserved");
        }
        if (!ids.insert(id).second) {
            throw std::invalid_argument("WizardBuilder: duplicate step id '" + id + "'");
        }
    }

    std::unique_ptr<StepSequence> seq(new StepSequence());
    seq->steps_ = std::move(steps_);
    seq->finish_service_ = std::move(finish_service_);
    seq->finish_operation_ = std::move(finish_operation_);
    seq->reference_prefix_ = std::move(reference_prefix_);

    steps_.clear();
    finish_service_.reset();
    finish_operation_ = "finish";
    reference_prefix_ = "WIZ";

    spdlog::debug("[WizardBuilder] Built sequence of {} step(s), finish '{}'", seq->size(),
                  seq->finish_operation_);
    return seq;
}

} // namespace waypoint
