// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file http_step_service.h
 * @brief RemoteStepService over HTTP/JSON using libhv
 *
 * Each execute() POSTs the payload to base_url + endpoint on a tracked
 * background thread. The endpoint for an operation comes from the configured
 * endpoint map, falling back to /operations/{operation}.
 *
 * Thread safety: without a CompletionQueue, callbacks run on the request
 * thread. With one, they are posted to it and run wherever it is drained.
 * Finished request threads are joined when the next request starts; the
 * destructor waits up to two seconds for the rest and detaches stragglers,
 * so the queue must outlive the service.
 */

#include "completion_queue.h"
#include "remote_step_service.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "hv/json.hpp"

namespace waypoint {

struct HttpStepServiceConfig {
    std::string base_url;
    int timeout_sec = 30;
    std::map<std::string, std::string> endpoints; ///< operation -> path
    std::string bearer_token;
};

/// Interpreted HTTP exchange; either identifiers or a failure
struct HttpOutcome {
    bool success = false;
    nlohmann::json identifiers = nlohmann::json::object();
    RemoteFailure failure;
};

/**
 * @brief Map a raw HTTP exchange to a step result
 *
 * @param status_code HTTP status, or 0 if no response arrived
 * @param body Response body (may be empty or non-JSON)
 * @param elapsed Time the request took
 * @param timeout_sec Configured timeout; a missing response at or past it is a Timeout
 */
HttpOutcome interpret_http_response(int status_code, const std::string& body,
                                    std::chrono::milliseconds elapsed, int timeout_sec);

class HttpStepService : public RemoteStepService {
  public:
    explicit HttpStepService(HttpStepServiceConfig config, CompletionQueue* queue = nullptr);
    ~HttpStepService() override;

    HttpStepService(const HttpStepService&) = delete;
    HttpStepService& operator=(const HttpStepService&) = delete;

    void execute(const std::string& operation, const nlohmann::json& payload,
                 SuccessCallback on_success, ErrorCallback on_error) override;

    /// Replace the bearer token (after re-authentication)
    void set_bearer_token(const std::string& token);

    /// Path for an operation (configured or /operations/{operation})
    std::string endpoint_for(const std::string& operation) const;

    /// Full URL for an operation
    std::string url_for(const std::string& operation) const;

    /// Rejects empty paths, "..", and CR/LF/NUL
    static bool is_safe_endpoint(const std::string& endpoint);

    /// Request threads not yet joined, finished or not
    size_t tracked_threads() const;

    /// Request threads still running
    size_t running_threads() const;

  private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void launch_http_thread(std::function<void()> func);
    void reap_finished_locked();
    static void deliver(CompletionQueue* queue, std::function<void()> callback);

    HttpStepServiceConfig config_;
    CompletionQueue* queue_ = nullptr;

    mutable std::mutex token_mutex_;
    std::string bearer_token_;

    mutable std::mutex http_threads_mutex_;
    std::list<Worker> http_threads_;
    std::atomic<bool> shutting_down_{false};
};

} // namespace waypoint
