// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "remote_error.h"

#include "json_utils.h"

#include <spdlog/spdlog.h>

namespace waypoint {

const char* remote_error_category_name(RemoteErrorCategory category) {
    switch (category) {
    case RemoteErrorCategory::Validation:
        return "validation";
    case RemoteErrorCategory::Unauthorized:
        return "unauthorized";
    case RemoteErrorCategory::Forbidden:
        return "forbidden";
    case RemoteErrorCategory::NotFound:
        return "not_found";
    case RemoteErrorCategory::Conflict:
        return "conflict";
    case RemoteErrorCategory::ServerError:
        return "server_error";
    case RemoteErrorCategory::NetworkError:
        return "network_error";
    case RemoteErrorCategory::Timeout:
        return "timeout";
    }
    return "unknown";
}

RemoteErrorCategory category_from_http_status(int status) {
    switch (status) {
    case 400:
    case 422:
        return RemoteErrorCategory::Validation;
    case 401:
        return RemoteErrorCategory::Unauthorized;
    case 403:
        return RemoteErrorCategory::Forbidden;
    case 404:
        return RemoteErrorCategory::NotFound;
    case 408:
        return RemoteErrorCategory::Timeout;
    case 409:
        return RemoteErrorCategory::Conflict;
    default:
        break;
    }
    if (status <= 0) {
        return RemoteErrorCategory::NetworkError;
    }
    return RemoteErrorCategory::ServerError;
}

std::vector<FieldError> extract_field_errors(const json& body) {
    std::vector<FieldError> result;
    if (!body.is_object() || !body.contains("errors")) {
        return result;
    }

    const auto& errors = body["errors"];
    if (errors.is_object()) {
        for (auto it = errors.begin(); it != errors.end(); ++it) {
            if (it.value().is_array()) {
                for (const auto& msg : it.value()) {
                    if (msg.is_string()) {
                        result.push_back(FieldError{it.key(), msg.get<std::string>()});
                    }
                }
            } else if (it.value().is_string()) {
                result.push_back(FieldError{it.key(), it.value().get<std::string>()});
            }
        }
    } else if (errors.is_array()) {
        for (const auto& msg : errors) {
            if (msg.is_string()) {
                result.push_back(FieldError{"", msg.get<std::string>()});
            }
        }
    }
    return result;
}

RemoteFailure failure_from_http(int status, const json& body, const std::string& fallback) {
    RemoteFailure failure;
    failure.category = category_from_http_status(status);
    failure.status_code = status;
    failure.field_errors = extract_field_errors(body);

    if (body.is_object()) {
        for (const char* key : {"title", "message", "error", "detail"}) {
            std::string msg = json_util::safe_string(body, key);
            if (!msg.empty()) {
                failure.message = msg;
                break;
            }
        }
    }
    if (failure.message.empty()) {
        failure.message = fallback;
    }
    return failure;
}

// ============================================================================
// WizardError
// ============================================================================

std::string WizardError::get_kind_string() const {
    switch (kind) {
    case WizardErrorKind::None:
        return "NONE";
    case WizardErrorKind::LocalValidation:
        return "LOCAL_VALIDATION";
    case WizardErrorKind::RemoteValidation:
        return "REMOTE_VALIDATION";
    case WizardErrorKind::Conflict:
        return "CONFLICT";
    case WizardErrorKind::Auth:
        return "AUTH";
    case WizardErrorKind::Transient:
        return "TRANSIENT";
    case WizardErrorKind::Rejected:
        return "REJECTED";
    case WizardErrorKind::Internal:
        return "INTERNAL";
    }
    return "UNKNOWN";
}

std::string WizardError::user_message() const {
    if (!message.empty()) {
        return message;
    }
    switch (kind) {
    case WizardErrorKind::LocalValidation:
    case WizardErrorKind::RemoteValidation:
        return "Please correct the highlighted fields.";
    case WizardErrorKind::Conflict:
        return "The record was changed or already exists.";
    case WizardErrorKind::Auth:
        return "Your session has expired. Please sign in again.";
    case WizardErrorKind::Transient:
        return "The server could not be reached. Please try again.";
    case WizardErrorKind::Rejected:
        return "The requested record was not found.";
    case WizardErrorKind::Internal:
        return "An unexpected error stopped the wizard.";
    case WizardErrorKind::None:
        break;
    }
    return "";
}

RecoveryAction WizardError::recovery() const {
    switch (kind) {
    case WizardErrorKind::LocalValidation:
    case WizardErrorKind::RemoteValidation:
        return RecoveryAction::FixFields;
    case WizardErrorKind::Conflict:
        return RecoveryAction::ViewConflict;
    case WizardErrorKind::Auth:
        return RecoveryAction::Reauthenticate;
    case WizardErrorKind::Transient:
        return RecoveryAction::Retry;
    case WizardErrorKind::Rejected:
    case WizardErrorKind::Internal:
        return RecoveryAction::ContactSupport;
    case WizardErrorKind::None:
        break;
    }
    return RecoveryAction::None;
}

ValidationResult WizardError::as_validation() const {
    ValidationResult result;
    for (const auto& fe : field_errors) {
        result.add_error(fe.field, fe.message);
    }
    if (result.errors.empty() && (kind == WizardErrorKind::RemoteValidation ||
                                  kind == WizardErrorKind::LocalValidation)) {
        result.add_error("", user_message());
    }
    return result;
}

WizardError WizardError::from_remote(const RemoteFailure& failure, const std::string& step_id) {
    WizardError err;
    err.step_id = step_id;
    err.message = failure.message;
    err.field_errors = failure.field_errors;
    err.status_code = failure.status_code;

    switch (failure.category) {
    case RemoteErrorCategory::Validation:
        err.kind = WizardErrorKind::RemoteValidation;
        break;
    case RemoteErrorCategory::Conflict:
        err.kind = WizardErrorKind::Conflict;
        break;
    case RemoteErrorCategory::Unauthorized:
    case RemoteErrorCategory::Forbidden:
        err.kind = WizardErrorKind::Auth;
        break;
    case RemoteErrorCategory::NotFound:
        err.kind = WizardErrorKind::Rejected;
        break;
    case RemoteErrorCategory::ServerError:
    case RemoteErrorCategory::NetworkError:
    case RemoteErrorCategory::Timeout:
        err.kind = WizardErrorKind::Transient;
        break;
    }

    if (err.kind == WizardErrorKind::Transient) {
        spdlog::warn("[RemoteError] {} failed ({}): {}", step_id,
                     remote_error_category_name(failure.category), failure.message);
    } else {
        spdlog::info("[RemoteError] {} rejected ({}): {}", step_id,
                     remote_error_category_name(failure.category), failure.message);
    }
    return err;
}

WizardError WizardError::local_validation(const ValidationResult& result,
                                          const std::string& step_id) {
    WizardError err;
    err.kind = WizardErrorKind::LocalValidation;
    err.step_id = step_id;
    err.field_errors = result.errors;
    return err;
}

WizardError WizardError::internal(const std::string& message, const std::string& step_id) {
    WizardError err;
    err.kind = WizardErrorKind::Internal;
    err.step_id = step_id;
    err.message = message;
    return err;
}

} // namespace waypoint
