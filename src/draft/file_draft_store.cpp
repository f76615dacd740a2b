// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "file_draft_store.h"

#include "draft_codec.h"
#include "utils/identity.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace waypoint {

namespace {
constexpr const char* DRAFT_EXTENSION = ".json";
}

FileDraftStore::FileDraftStore(std::string directory) : directory_(std::move(directory)) {
    spdlog::debug("[FileDraftStore] Using {}", directory_);
}

bool FileDraftStore::is_valid_id(const std::string& id) {
    if (id.empty() || id.size() > 128) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

std::string FileDraftStore::generate_id() {
    return "draft-" + format_utc(std::chrono::system_clock::now(), "%Y%m%d%H%M%S") + "-" +
           random_hex(8);
}

std::string FileDraftStore::path_for(const std::string& id) const {
    return directory_ + "/" + id + DRAFT_EXTENSION;
}

bool FileDraftStore::ensure_directory() const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        spdlog::error("[FileDraftStore] Cannot create {}: {}", directory_, ec.message());
        return false;
    }
    return true;
}

// =============================================================================
// DraftStore
// =============================================================================

std::optional<std::string> FileDraftStore::save(const DraftRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    DraftRecord stored = record;
    if (stored.id.empty()) {
        stored.id = generate_id();
    } else if (!is_valid_id(stored.id)) {
        spdlog::warn("[FileDraftStore] Refusing to save draft with invalid id '{}'", stored.id);
        return std::nullopt;
    }

    if (!ensure_directory()) {
        return std::nullopt;
    }

    const std::string path = path_for(stored.id);
    const std::string tmp_path = path + ".tmp";
    try {
        {
            std::ofstream file(tmp_path, std::ios::trunc);
            if (!file.good()) {
                spdlog::warn("[FileDraftStore] Failed to open {} for writing", tmp_path);
                return std::nullopt;
            }
            file << draft_to_json(stored).dump(2);
            file.flush();
            if (!file.good()) {
                spdlog::error("[FileDraftStore] Write to {} failed", tmp_path);
                return std::nullopt;
            }
        }

        std::error_code ec;
        fs::rename(tmp_path, path, ec);
        if (ec) {
            spdlog::error("[FileDraftStore] Failed to move {} into place: {}", tmp_path,
                          ec.message());
            fs::remove(tmp_path, ec);
            return std::nullopt;
        }
    } catch (const std::exception& e) {
        spdlog::error("[FileDraftStore] Failed to save {}: {}", stored.id, e.what());
        return std::nullopt;
    }

    spdlog::trace("[FileDraftStore] Saved {} (step {})", stored.id, stored.current_step_index);
    return stored.id;
}

std::optional<DraftRecord> FileDraftStore::load(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_valid_id(id)) {
        spdlog::warn("[FileDraftStore] Invalid draft id '{}'", id);
        return std::nullopt;
    }

    const std::string path = path_for(id);
    try {
        std::ifstream file(path);
        if (!file.good()) {
            spdlog::debug("[FileDraftStore] No draft at {}", path);
            return std::nullopt;
        }

        json j = json::parse(file);
        std::string error;
        auto record = draft_from_json(j, &error);
        if (!record) {
            spdlog::warn("[FileDraftStore] Ignoring malformed draft {}: {}", path, error);
            return std::nullopt;
        }
        // File name is authoritative
        record->id = id;
        return record;
    } catch (const json::parse_error& e) {
        spdlog::warn("[FileDraftStore] Failed to parse {}: {}", path, e.what());
    } catch (const std::exception& e) {
        spdlog::warn("[FileDraftStore] Failed to load {}: {}", path, e.what());
    }
    return std::nullopt;
}

bool FileDraftStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_valid_id(id)) {
        return false;
    }

    std::error_code ec;
    bool removed = fs::remove(path_for(id), ec);
    if (ec) {
        spdlog::warn("[FileDraftStore] Failed to remove {}: {}", id, ec.message());
        return false;
    }
    if (removed) {
        spdlog::debug("[FileDraftStore] Removed {}", id);
    }
    return removed;
}

std::vector<std::string> FileDraftStore::list_ids() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return ids;
    }

    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const fs::path& p = it->path();
        if (p.extension() != DRAFT_EXTENSION) {
            continue;
        }
        std::string id = p.stem().string();
        if (is_valid_id(id)) {
            ids.push_back(std::move(id));
        }
    }
    if (ec) {
        spdlog::warn("[FileDraftStore] Error listing {}: {}", directory_, ec.message());
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace waypoint
