// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "draft_store.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace waypoint {

/**
 * @brief DraftStore keeping one JSON file per draft in a directory
 *
 * Files are named <id>.json. Writes go to <id>.json.tmp first and are renamed
 * into place, so a crash mid-write leaves the previous version intact.
 * Ids are restricted to [A-Za-z0-9_-] to keep them inside the directory.
 *
 * Thread-safe: all operations hold an internal mutex.
 */
class FileDraftStore : public DraftStore {
  public:
    explicit FileDraftStore(std::string directory);

    std::optional<std::string> save(const DraftRecord& record) override;
    std::optional<DraftRecord> load(const std::string& id) override;
    bool remove(const std::string& id) override;
    std::vector<std::string> list_ids() override;

    const std::string& directory() const {
        return directory_;
    }

    /// True if id is non-empty and only uses [A-Za-z0-9_-]
    static bool is_valid_id(const std::string& id);

    /// New id of the form draft-YYYYMMDDHHMMSS-xxxxxxxx
    static std::string generate_id();

  private:
    std::string path_for(const std::string& id) const;
    bool ensure_directory() const;

    std::string directory_;
    mutable std::mutex mutex_;
};

} // namespace waypoint
