// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wizard_context.h"

#include "utils/identity.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace waypoint {

WizardContext::WizardContext(const std::string& reference_prefix)
    : reference_prefix_(reference_prefix.empty() ? "WIZ" : reference_prefix) {
    regenerate_identity();
}

void WizardContext::regenerate_identity() {
    wizard_id_ = generate_uuid();

    std::string short_id = wizard_id_.substr(0, 4);
    std::transform(short_id.begin(), short_id.end(), short_id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    reference_number_ = reference_prefix_ + "-" +
                        format_utc(std::chrono::system_clock::now(), "%Y%m%d%H%M%S") + "-" +
                        short_id;
}

const json& WizardContext::get(const std::string& key) const {
    auto it = slots_.find(key);
    if (it == slots_.end()) {
        throw std::out_of_range("Context slot '" + key + "' has not been written");
    }
    return it->second;
}

json WizardContext::get(const std::string& key, const json& default_value) const {
    auto it = slots_.find(key);
    return it == slots_.end() ? default_value : it->second;
}

bool WizardContext::contains(const std::string& key) const {
    return slots_.count(key) > 0;
}

void WizardContext::set(const std::string& key, json value) {
    if (finalized_.count(key) > 0) {
        throw ImmutableFieldError(key);
    }
    slots_[key] = std::move(value);
}

void WizardContext::mark_finalized(const std::string& key) {
    if (slots_.count(key) == 0) {
        throw std::invalid_argument("Cannot finalize unwritten context slot '" + key + "'");
    }
    finalized_.insert(key);
}

bool WizardContext::is_finalized(const std::string& key) const {
    return finalized_.count(key) > 0;
}

std::vector<std::string> WizardContext::keys() const {
    std::vector<std::string> out;
    out.reserve(slots_.size());
    for (const auto& [key, value] : slots_) {
        out.push_back(key);
    }
    return out;
}

json WizardContext::to_snapshot() const {
    json slots = json::object();
    for (const auto& [key, value] : slots_) {
        slots[key] = value;
    }

    // std::set iterates sorted, so equal contexts produce equal snapshots
    json finalized = json::array();
    for (const auto& key : finalized_) {
        finalized.push_back(key);
    }

    return json{{"wizard_id", wizard_id_},
                {"reference_number", reference_number_},
                {"slots", std::move(slots)},
                {"finalized", std::move(finalized)}};
}

void WizardContext::restore_from_snapshot(const json& snapshot) {
    if (!snapshot.is_object()) {
        throw std::invalid_argument("Context snapshot must be a JSON object");
    }
    if (!snapshot.contains("slots") || !snapshot["slots"].is_object()) {
        throw std::invalid_argument("Context snapshot has no 'slots' object");
    }

    std::map<std::string, json> slots;
    for (auto it = snapshot["slots"].begin(); it != snapshot["slots"].end(); ++it) {
        slots[it.key()] = it.value();
    }

    std::set<std::string> finalized;
    if (snapshot.contains("finalized")) {
        const auto& list = snapshot["finalized"];
        if (!list.is_array()) {
            throw std::invalid_argument("Context snapshot 'finalized' must be an array");
        }
        for (const auto& key : list) {
            if (!key.is_string() || slots.count(key.get<std::string>()) == 0) {
                throw std::invalid_argument("Context snapshot finalizes an unknown slot");
            }
            finalized.insert(key.get<std::string>());
        }
    }

    // Validation passed: commit
    slots_ = std::move(slots);
    finalized_ = std::move(finalized);

    if (snapshot.contains("wizard_id") && snapshot["wizard_id"].is_string()) {
        wizard_id_ = snapshot["wizard_id"].get<std::string>();
    }
    if (snapshot.contains("reference_number") && snapshot["reference_number"].is_string()) {
        reference_number_ = snapshot["reference_number"].get<std::string>();
    }

    spdlog::debug("[WizardContext] Restored {} slots ({} finalized) for {}", slots_.size(),
                  finalized_.size(), reference_number_);
}

void WizardContext::reset() {
    slots_.clear();
    finalized_.clear();
    regenerate_identity();
    spdlog::debug("[WizardContext] Reset, new reference {}", reference_number_);
}

} // namespace waypoint
