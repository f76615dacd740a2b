// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_DRAFT_STORE_H
#define MOCK_DRAFT_STORE_H

/**
 * @file mock_draft_store.h
 * @brief In-memory DraftStore for testing
 *
 * Assigns ids "draft-1", "draft-2", ... and records every save so tests can
 * check how often the controller persisted. Saves can be made to fail.
 */

#include "draft_store.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace waypoint;

class MockDraftStore : public DraftStore {
  public:
    MockDraftStore() = default;
    ~MockDraftStore() override = default;

    // Non-copyable
    MockDraftStore(const MockDraftStore&) = delete;
    MockDraftStore& operator=(const MockDraftStore&) = delete;

    std::optional<std::string> save(const DraftRecord& record) override {
        ++save_count_;
        if (fail_saves_) {
            return std::nullopt;
        }
        DraftRecord stored = record;
        if (stored.id.empty()) {
            stored.id = "draft-" + std::to_string(++next_id_);
        }
        records_[stored.id] = stored;
        return stored.id;
    }

    std::optional<DraftRecord> load(const std::string& id) override {
        auto it = records_.find(id);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool remove(const std::string& id) override {
        return records_.erase(id) > 0;
    }

    std::vector<std::string> list_ids() override {
        std::vector<std::string> ids;
        for (const auto& [id, record] : records_) {
            ids.push_back(id);
        }
        return ids;
    }

    // ------------------------------------------------------------------------
    // Test controls
    // ------------------------------------------------------------------------

    void set_fail_saves(bool fail) {
        fail_saves_ = fail;
    }

    /// Insert a record directly (bypasses save_count)
    void put(const DraftRecord& record) {
        records_[record.id] = record;
    }

    size_t save_count() const {
        return save_count_;
    }

    bool contains(const std::string& id) const {
        return records_.count(id) > 0;
    }

    const DraftRecord& at(const std::string& id) const {
        return records_.at(id);
    }

  private:
    std::map<std::string, DraftRecord> records_;
    size_t save_count_ = 0;
    int next_id_ = 0;
    bool fail_saves_ = false;
};

#endif // MOCK_DRAFT_STORE_H
