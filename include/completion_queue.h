// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file completion_queue.h
 * @brief Hands background completions back to the thread that owns a wizard
 *
 * Wizard state (context, guard, navigator) is only ever touched on the owner
 * thread. Services that finish work on other threads (HttpStepService) post
 * their callbacks here, and the owner drains the queue from its loop.
 *
 * Usage:
 * @code
 * // Worker thread:
 * queue->post([cb, identifiers]() { cb(identifiers); });
 *
 * // Owner thread:
 * while (running) {
 *     queue.wait_for_pending(std::chrono::milliseconds(100));
 *     queue.process_pending();
 * }
 * @endcode
 */

#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>

namespace waypoint {

class CompletionQueue {
  public:
    using Callback = std::function<void()>;

    CompletionQueue() = default;

    // Non-copyable
    CompletionQueue(const CompletionQueue&) = delete;
    CompletionQueue& operator=(const CompletionQueue&) = delete;

    /**
     * @brief Queue a callback for the owner thread
     *
     * Thread-safe. Can be called from any thread.
     */
    void post(Callback callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push(std::move(callback));
        }
        cv_.notify_all();
    }

    /**
     * @brief Run every queued callback on the calling thread
     *
     * Callbacks posted while draining run on the next call.
     *
     * @return Number of callbacks executed
     */
    size_t process_pending() {
        // Move pending callbacks to a local queue to minimize lock time
        std::queue<Callback> to_process;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::swap(to_process, pending_);
        }

        size_t count = 0;
        while (!to_process.empty()) {
            auto& callback = to_process.front();
            try {
                callback();
            } catch (const std::exception& e) {
                spdlog::error("[CompletionQueue] Callback threw: {}", e.what());
            }
            to_process.pop();
            ++count;
        }
        return count;
    }

    /**
     * @brief Block until something is queued or the timeout expires
     *
     * @return true if callbacks are pending
     */
    bool wait_for_pending(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return !pending_.empty(); });
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Callback> pending_;
};

} // namespace waypoint
