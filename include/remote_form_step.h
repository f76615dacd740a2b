// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "form_step.h"
#include "remote_step_service.h"

#include <memory>
#include <string>
#include <vector>

namespace waypoint {

/**
 * @brief Form step whose commit performs a remote mutation
 *
 * Request payload:
 * @code
 * {
 *   "reference_number": "SRV-...",
 *   "fields": { ...collect_data()... },
 *   "context": { ...required_context slots... }
 * }
 * @endcode
 *
 * On success the fields and every returned identifier are written to the
 * context and finalized. A success response that lacks one of the expected
 * identifiers leaves the remote side in an unknown state and is Fatal; the
 * step still counts as committed so the mutation is never sent twice.
 */
class RemoteFormStep : public FormStep {
  public:
    RemoteFormStep(FormStepConfig config, std::shared_ptr<RemoteStepService> service,
                   std::string operation, std::vector<std::string> expected_identifiers = {});

    const std::string& operation() const {
        return operation_;
    }

    /// Body sent to the service for the current local data
    nlohmann::json build_request(const WizardContext& ctx) const;

    bool has_remote_effect() const override {
        return true;
    }

  protected:
    void on_next(WizardContext& ctx, StepCompletion done) override;

  private:
    std::shared_ptr<RemoteStepService> service_;
    std::string operation_;
    std::vector<std::string> expected_identifiers_;
};

} // namespace waypoint
