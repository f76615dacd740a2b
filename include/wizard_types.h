// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>

namespace waypoint {

/// Per-step lifecycle state. Order of steps never changes at runtime.
enum class StepStatus {
    NotStarted,
    Active,
    Completed,
};

const char* step_status_name(StepStatus status);

/// A single field-level message, in the order it was produced
struct FieldError {
    std::string field;   ///< Field name ("" for step-level messages)
    std::string message; ///< Human-readable message, shown verbatim

    bool operator==(const FieldError& other) const {
        return field == other.field && message == other.message;
    }
};

/**
 * @brief Result of validating a step (locally or remotely)
 *
 * Warnings are informational and never make a result invalid.
 */
struct ValidationResult {
    bool valid = true;
    std::vector<FieldError> errors;
    std::vector<std::string> warnings;

    void add_error(const std::string& field, const std::string& message) {
        errors.push_back(FieldError{field, message});
        valid = false;
    }

    void add_warning(const std::string& message) {
        warnings.push_back(message);
    }

    bool has_errors() const {
        return !errors.empty();
    }

    bool has_warnings() const {
        return !warnings.empty();
    }

    /// Joins messages as "field: message" lines for logs and banners
    std::string summary() const;

    bool operator==(const ValidationResult& other) const {
        return valid == other.valid && errors == other.errors && warnings == other.warnings;
    }
};

} // namespace waypoint
