// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "remote_step_service.h"
#include "wizard_step.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace waypoint {

/**
 * @brief Immutable ordered list of steps plus the finish operation
 *
 * Produced by WizardBuilder. The order and membership of steps cannot change
 * after build(); the steps themselves keep their own local editable state.
 */
class StepSequence {
  public:
    size_t size() const {
        return steps_.size();
    }

    WizardStep& at(size_t index) {
        return *steps_.at(index);
    }

    const WizardStep& at(size_t index) const {
        return *steps_.at(index);
    }

    std::optional<size_t> index_of(const std::string& step_id) const;

    /// Service used by finish(); null means finish completes locally
    const std::shared_ptr<RemoteStepService>& finish_service() const {
        return finish_service_;
    }

    const std::string& finish_operation() const {
        return finish_operation_;
    }

    const std::string& reference_prefix() const {
        return reference_prefix_;
    }

  private:
    friend class WizardBuilder;
    StepSequence() = default;

    std::vector<std::unique_ptr<WizardStep>> steps_;
    std::shared_ptr<RemoteStepService> finish_service_;
    std::string finish_operation_ = "finish";
    std::string reference_prefix_ = "WIZ";
};

/**
 * @brief Assembles a StepSequence before the controller starts
 *
 * Usage:
 * @code
 * auto steps = WizardBuilder()
 *                  .reference_prefix("SRV")
 *                  .add(std::make_unique<FormStep>(building_cfg))
 *                  .add(std::make_unique<RemoteFormStep>(unit_cfg, api, "create_unit"))
 *                  .finish_with(api, "finalize_survey")
 *                  .build();
 * WizardController wizard(std::move(steps), drafts);
 * @endcode
 */
class WizardBuilder {
  public:
    WizardBuilder& add(std::unique_ptr<WizardStep> step);

    template <typename T, typename... Args> WizardBuilder& emplace(Args&&... args) {
        return add(std::make_unique<T>(std::forward<Args>(args)...));
    }

    WizardBuilder& finish_with(std::shared_ptr<RemoteStepService> service,
                               std::string operation = "finish");

    WizardBuilder& reference_prefix(std::string prefix);

    /**
     * @brief Produce the sequence; the builder is empty afterwards
     * @throws std::invalid_argument on no steps, null steps, empty,
     *         duplicate or reserved step ids
     */
    std::unique_ptr<StepSequence> build();

  private:
    std::vector<std::unique_ptr<WizardStep>> steps_;
    std::shared_ptr<RemoteStepService> finish_service_;
    std::string finish_operation_ = "finish";
    std::string reference_prefix_ = "WIZ";
};

} // namespace waypoint
