// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file wizard_definition.h
 * @brief Declarative wizard layout loaded from JSON
 *
 * @code
 * {
 *   "reference_prefix": "SRV",
 *   "steps": [
 *     {"id": "building", "title": "Building",
 *      "fields": [{"name": "building_id", "required": true, "context_key": "building_id"}]},
 *     {"id": "unit", "title": "Unit", "operation": "create_unit",
 *      "requires": ["building_id"], "expected_identifiers": ["unit_id"],
 *      "fields": [{"name": "unit_number", "required": true, "context_key": "unit_number",
 *                  "pattern": "^[0-9]+$", "message": "digits only"}]}
 *   ],
 *   "finish": {"operation": "finalize_survey"}
 * }
 * @endcode
 *
 * A step with an "operation" becomes a RemoteFormStep; one without becomes a
 * plain FormStep. "context_key" defaults to the field name; use "" to keep a
 * field local to its step.
 */

#include "remote_step_service.h"
#include "wizard_builder.h"

#include <memory>
#include <string>
#include <vector>

#include "hv/json.hpp"

namespace waypoint {

struct FieldDefinition {
    std::string name;
    bool required = false;
    std::string context_key;
    bool finalize = true;
    std::string pattern; ///< ECMAScript regex the value must match ("" = any)
    std::string message; ///< Error shown when pattern does not match
};

struct StepDefinition {
    std::string id;
    std::string title;
    std::string operation; ///< Remote operation; empty for a local step
    std::vector<std::string> required_context;
    std::vector<std::string> expected_identifiers;
    std::vector<FieldDefinition> fields;
};

class WizardDefinition {
  public:
    /**
     * @brief Parse a definition document
     * @throws std::invalid_argument on missing ids, bad types or invalid patterns
     */
    static WizardDefinition from_json(const nlohmann::json& j);

    /**
     * @brief Read and parse a definition file
     * @throws std::runtime_error if the file cannot be read or is not JSON
     * @throws std::invalid_argument if the document is not a valid definition
     */
    static WizardDefinition load_file(const std::string& path);

    /**
     * @brief Instantiate the steps
     *
     * @param service Used by remote steps and the finish operation
     * @throws std::invalid_argument if remote steps exist but service is null
     */
    std::unique_ptr<StepSequence> build(std::shared_ptr<RemoteStepService> service) const;

    const std::string& reference_prefix() const {
        return reference_prefix_;
    }

    const std::vector<StepDefinition>& steps() const {
        return steps_;
    }

    /// Finish operation name; empty means finish completes locally
    const std::string& finish_operation() const {
        return finish_operation_;
    }

    bool has_remote_steps() const;

  private:
    std::string reference_prefix_ = "WIZ";
    std::vector<StepDefinition> steps_;
    std::string finish_operation_;
};

} // namespace waypoint
