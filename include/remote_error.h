// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file remote_error.h
 * @brief Classification of remote step failures
 *
 * Every failure reported by a RemoteStepService is normalized into a
 * WizardError at the onNext boundary. The navigator and controller only ever
 * see WizardError values, never raw categories or HTTP statuses.
 *
 * | Category      | Kind              | Recovery        |
 * |---------------|-------------------|-----------------|
 * | Validation    | RemoteValidation  | FixFields       |
 * | Conflict      | Conflict          | ViewConflict    |
 * | Unauthorized  | Auth              | Reauthenticate  |
 * | Forbidden     | Auth              | Reauthenticate  |
 * | NotFound      | Rejected          | ContactSupport  |
 * | ServerError   | Transient         | Retry           |
 * | NetworkError  | Transient         | Retry           |
 * | Timeout       | Transient         | Retry           |
 */

#include "wizard_types.h"

#include <string>
#include <vector>

#include "hv/json.hpp"

namespace waypoint {

using json = nlohmann::json;

/// Failure categories a RemoteStepService may report
enum class RemoteErrorCategory {
    Validation,
    Unauthorized,
    Forbidden,
    NotFound,
    Conflict,
    ServerError,
    NetworkError,
    Timeout,
};

/// Failure payload of RemoteStepService::execute()
struct RemoteFailure {
    RemoteErrorCategory category = RemoteErrorCategory::ServerError;
    std::string message;
    std::vector<FieldError> field_errors;
    int status_code = 0; ///< HTTP status if the boundary has one, 0 otherwise
};

enum class WizardErrorKind {
    None,
    LocalValidation,
    RemoteValidation,
    Conflict,
    Auth,
    Transient,
    Rejected,
    Internal,
};

/// Call to action shown alongside an error
enum class RecoveryAction {
    None,
    FixFields,
    ViewConflict,
    Reauthenticate,
    Retry,
    ContactSupport,
};

/**
 * @brief Classified error surfaced to the presentation layer
 */
struct WizardError {
    WizardErrorKind kind = WizardErrorKind::None;
    std::string step_id;                  ///< Step (or "__finish__") that failed
    std::string message;                  ///< Verbatim message from the source
    std::vector<FieldError> field_errors; ///< Inline messages for field-level kinds
    int status_code = 0;

    bool has_error() const {
        return kind != WizardErrorKind::None;
    }

    std::string get_kind_string() const;

    /// Message for the banner; keeps the server message verbatim if present
    std::string user_message() const;

    RecoveryAction recovery() const;

    /// True if the same command can be retried without any user edits
    bool is_retryable() const {
        return kind == WizardErrorKind::Transient || kind == WizardErrorKind::Rejected ||
               kind == WizardErrorKind::Auth;
    }

    /// Field errors in ValidationResult shape for inline display
    ValidationResult as_validation() const;

    static WizardError from_remote(const RemoteFailure& failure, const std::string& step_id);
    static WizardError local_validation(const ValidationResult& result,
                                        const std::string& step_id);
    static WizardError internal(const std::string& message, const std::string& step_id);
};

const char* remote_error_category_name(RemoteErrorCategory category);

/// Maps a non-2xx HTTP status to a failure category
RemoteErrorCategory category_from_http_status(int status);

/**
 * @brief Extract field errors from a remote error body
 *
 * Accepts `{"errors": {"field": ["msg", ...]}}`, `{"errors": {"field": "msg"}}`
 * and `{"errors": ["msg", ...]}`. Anything else yields an empty list.
 */
std::vector<FieldError> extract_field_errors(const json& body);

/**
 * @brief Build a RemoteFailure from an HTTP error response
 *
 * @param status HTTP status code (0 when no response was received)
 * @param body Parsed body (may be null)
 * @param fallback Message used when the body carries none
 */
RemoteFailure failure_from_http(int status, const json& body, const std::string& fallback);

} // namespace waypoint
