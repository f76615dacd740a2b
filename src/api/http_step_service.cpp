// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "http_step_service.h"

#include "hv/requests.h"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace waypoint {

HttpOutcome interpret_http_response(int status_code, const std::string& body,
                                    std::chrono::milliseconds elapsed, int timeout_sec) {
    HttpOutcome outcome;

    if (status_code <= 0) {
        const bool timed_out =
            timeout_sec > 0 && elapsed >= std::chrono::seconds(timeout_sec);
        outcome.failure.category =
            timed_out ? RemoteErrorCategory::Timeout : RemoteErrorCategory::NetworkError;
        outcome.failure.message = timed_out ? "The server did not respond in time"
                                            : "The server could not be reached";
        return outcome;
    }

    json parsed;
    if (!body.empty()) {
        try {
            parsed = json::parse(body);
        } catch (const json::parse_error& e) {
            spdlog::trace("[HttpStepService] Response body is not JSON: {}", e.what());
        }
    }

    if (status_code >= 200 && status_code < 300) {
        outcome.success = true;
        if (parsed.is_object()) {
            outcome.identifiers = std::move(parsed);
        }
        return outcome;
    }

    outcome.failure = failure_from_http(status_code, parsed,
                                        "Request failed with HTTP " + std::to_string(status_code));
    return outcome;
}

// ============================================================================
// HttpStepService
// ============================================================================

HttpStepService::HttpStepService(HttpStepServiceConfig config, CompletionQueue* queue)
    : config_(std::move(config)), queue_(queue), bearer_token_(config_.bearer_token) {
    spdlog::debug("[HttpStepService] Base URL {} (timeout {}s, {} mapped operation(s))",
                  config_.base_url, config_.timeout_sec, config_.endpoints.size());
}

HttpStepService::~HttpStepService() {
    shutting_down_.store(true);

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(http_threads_mutex_);
        workers = std::move(http_threads_);
    }
    if (workers.empty()) {
        return;
    }

    spdlog::debug("[HttpStepService] Waiting for {} HTTP thread(s) to finish...",
                  workers.size());

    constexpr auto kJoinTimeout = std::chrono::seconds(2);
    constexpr auto kPollInterval = std::chrono::milliseconds(10);

    const auto deadline = std::chrono::steady_clock::now() + kJoinTimeout;
    auto all_done = [&workers]() {
        for (const auto& w : workers) {
            if (!w.done->load()) {
                return false;
            }
        }
        return true;
    };
    while (!all_done() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kPollInterval);
    }

    // Each std::thread is touched by this thread only
    size_t detached = 0;
    for (auto& w : workers) {
        if (w.done->load()) {
            w.thread.join();
        } else {
            w.thread.detach();
            ++detached;
        }
    }
    if (detached > 0) {
        spdlog::warn("[HttpStepService] {} HTTP thread(s) still running after {}s, detached",
                     detached, kJoinTimeout.count());
    }
}

bool HttpStepService::is_safe_endpoint(const std::string& endpoint) {
    if (endpoint.empty()) {
        return false;
    }
    if (endpoint.find("..") != std::string::npos) {
        return false;
    }
    for (char c : endpoint) {
        if (c == '\n' || c == '\r' || c == '\0') {
            return false;
        }
    }
    return true;
}

void HttpStepService::set_bearer_token(const std::string& token) {
    std::lock_guard<std::mutex> lock(token_mutex_);
    bearer_token_ = token;
}

std::string HttpStepService::endpoint_for(const std::string& operation) const {
    auto it = config_.endpoints.find(operation);
    if (it != config_.endpoints.end() && !it->second.empty()) {
        return it->second;
    }
    return "/operations/" + operation;
}

std::string HttpStepService::url_for(const std::string& operation) const {
    std::string url = config_.base_url;
    std::string endpoint = endpoint_for(operation);
    if (!url.empty() && url.back() == '/' && endpoint.front() == '/') {
        url.pop_back();
    } else if ((url.empty() || url.back() != '/') && endpoint.front() != '/') {
        url += "/";
    }
    return url + endpoint;
}

size_t HttpStepService::tracked_threads() const {
    std::lock_guard<std::mutex> lock(http_threads_mutex_);
    return http_threads_.size();
}

size_t HttpStepService::running_threads() const {
    std::lock_guard<std::mutex> lock(http_threads_mutex_);
    size_t running = 0;
    for (const auto& w : http_threads_) {
        if (!w.done->load()) {
            ++running;
        }
    }
    return running;
}

void HttpStepService::reap_finished_locked() {
    for (auto it = http_threads_.begin(); it != http_threads_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = http_threads_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpStepService::launch_http_thread(std::function<void()> func) {
    if (shutting_down_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(http_threads_mutex_);
    reap_finished_locked();

    auto done = std::make_shared<std::atomic<bool>>(false);
    Worker worker;
    worker.done = done;
    worker.thread = std::thread([func = std::move(func), done]() {
        func();
        done->store(true);
    });
    http_threads_.push_back(std::move(worker));
}

void HttpStepService::deliver(CompletionQueue* queue, std::function<void()> callback) {
    if (queue) {
        queue->post(std::move(callback));
    } else {
        callback();
    }
}

void HttpStepService::execute(const std::string& operation, const json& payload,
                              SuccessCallback on_success, ErrorCallback on_error) {
    const std::string endpoint = endpoint_for(operation);
    if (!is_safe_endpoint(endpoint)) {
        spdlog::error("[HttpStepService] Refusing unsafe endpoint '{}' for '{}'", endpoint,
                      operation);
        RemoteFailure failure;
        failure.category = RemoteErrorCategory::ServerError;
        failure.message = "Invalid endpoint for operation '" + operation + "'";
        deliver(queue_, [on_error, failure]() {
            if (on_error) {
                on_error(failure);
            }
        });
        return;
    }

    const std::string url = url_for(operation);
    const std::string body = payload.dump();
    const int timeout_sec = config_.timeout_sec;
    std::string token;
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        token = bearer_token_;
    }

    // Log without body content to avoid exposing form data
    spdlog::debug("[HttpStepService] POST {} ({} bytes)", url, body.size());

    // May outlive this object (see destructor): no `this` capture
    launch_http_thread([queue = queue_, url, body, token, timeout_sec, operation, on_success,
                        on_error]() {
        auto req = std::make_shared<HttpRequest>();
        req->method = HTTP_POST;
        req->url = url;
        req->timeout = timeout_sec;
        req->content_type = APPLICATION_JSON;
        req->body = body;
        if (!token.empty()) {
            req->headers["Authorization"] = "Bearer " + token;
        }

        auto start = std::chrono::steady_clock::now();
        auto resp = requests::request(req);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        int status = resp ? static_cast<int>(resp->status_code) : 0;
        HttpOutcome outcome =
            interpret_http_response(status, resp ? resp->body : std::string(), elapsed,
                                    timeout_sec);

        if (outcome.success) {
            spdlog::debug("[HttpStepService] '{}' succeeded (HTTP {}, {}ms)", operation, status,
                          elapsed.count());
            deliver(queue, [on_success, identifiers = std::move(outcome.identifiers)]() {
                if (on_success) {
                    on_success(identifiers);
                }
            });
        } else {
            spdlog::warn("[HttpStepService] '{}' failed ({}, HTTP {}): {}", operation,
                         remote_error_category_name(outcome.failure.category), status,
                         outcome.failure.message);
            deliver(queue, [on_error, failure = std::move(outcome.failure)]() {
                if (on_error) {
                    on_error(failure);
                }
            });
        }
    });
}

} // namespace waypoint
