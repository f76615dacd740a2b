// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "remote_error.h"

#include <functional>
#include <string>

#include "hv/json.hpp"

namespace waypoint {

/**
 * @brief Boundary for side-effecting per-step remote operations
 *
 * Implementations may complete synchronously (inside execute()) or later.
 * Exactly one of the two callbacks must be invoked exactly once, and always on
 * the thread that owns the wizard (see CompletionQueue for thread hopping).
 */
class RemoteStepService {
  public:
    using SuccessCallback = std::function<void(const nlohmann::json& identifiers)>;
    using ErrorCallback = std::function<void(const RemoteFailure&)>;

    virtual ~RemoteStepService() = default;

    /**
     * @brief Perform a remote mutation
     *
     * @param operation Operation name (e.g. "create_unit")
     * @param payload JSON body built by the step
     * @param on_success Receives the identifiers object created remotely
     * @param on_error Receives the classified failure
     */
    virtual void execute(const std::string& operation, const nlohmann::json& payload,
                         SuccessCallback on_success, ErrorCallback on_error) = 0;
};

} // namespace waypoint
