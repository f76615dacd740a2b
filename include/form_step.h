// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wizard_step.h"

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "hv/json.hpp"

namespace waypoint {

/// Pure field check: returns an error message, or nullopt if the value is fine
using FieldValidator = std::function<std::optional<std::string>(const nlohmann::json& value)>;

struct FieldSpec {
    std::string name;
    bool required = false;
    std::string context_key; ///< Slot written on commit and pulled on show ("" = local only)
    bool finalize = true;    ///< Finalize the slot once written
    FieldValidator validator;
};

struct FormStepConfig {
    std::string id;
    std::string title;
    std::vector<FieldSpec> fields;
    std::vector<std::string> required_context; ///< Slots an earlier step must have finalized
};

/**
 * @brief Step with local editable fields and no remote mutation
 *
 * The presentation layer writes edits through set_field(). On show, fields
 * without a local edit are filled from their context slot, so re-entering a
 * step never discards what the user typed. Commit writes every bound field to
 * the context.
 */
class FormStep : public WizardStep {
  public:
    explicit FormStep(FormStepConfig config);

    /**
     * @brief Record a user edit
     * @throws std::invalid_argument for an undeclared field
     */
    void set_field(const std::string& name, nlohmann::json value);

    /// Current local value (null if never set)
    nlohmann::json field(const std::string& name) const;

    bool is_edited(const std::string& name) const {
        return edited_.count(name) > 0;
    }

    const FormStepConfig& config() const {
        return config_;
    }

    void on_show(const WizardContext& ctx) override;
    ValidationResult validate(const WizardContext& ctx) const override;
    nlohmann::json collect_data() const override;
    void restore_data(const nlohmann::json& data) override;
    void clear_data() override;

  protected:
    void on_next(WizardContext& ctx, StepCompletion done) override;

    /**
     * @brief Write bound fields into the context and finalize them
     *
     * A slot that is already finalized with the same value is left alone.
     *
     * @throws ImmutableFieldError if a finalized slot would change
     */
    void write_fields(WizardContext& ctx) const;

  private:
    const FieldSpec* find_field(const std::string& name) const;

    FormStepConfig config_;
    nlohmann::json values_ = nlohmann::json::object();
    std::set<std::string> edited_;
};

} // namespace waypoint
