// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wizard_config.h"

#include "error_reporting.h"
#include "utils/paths.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace waypoint {

namespace {

/// Copy keys from defaults that target lacks, recursing into objects
/// @return true if anything was added
bool backfill_defaults(json& target, const json& defaults) {
    bool modified = false;
    for (const auto& item : defaults.items()) {
        const std::string& key = item.key();
        if (!target.contains(key) || target[key].is_null()) {
            target[key] = item.value();
            modified = true;
        } else if (item.value().is_object() && target[key].is_object()) {
            modified = backfill_defaults(target[key], item.value()) || modified;
        }
    }
    return modified;
}

} // namespace

WizardConfig::WizardConfig() : data_(default_config()) {}

json WizardConfig::default_config() {
    return {{"log_level", "info"},
            {"log_target", "console"},
            {"log_file", ""},
            {"wizard", {{"reference_prefix", "WIZ"}}},
            {"drafts",
             {{"directory", ""}, {"delete_on_finish", false}, {"delete_on_cancel", false}}},
            {"remote",
             {{"base_url", ""},
              {"timeout_sec", 30},
              {"bearer_token", ""},
              {"endpoints", json::object()}}}};
}

bool WizardConfig::init(const std::string& config_path) {
    path_ = config_path;
    bool ok = true;
    bool modified = false;

    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        spdlog::info("[WizardConfig] Loading config from {}", config_path);
        bool corrupt = false;
        try {
            std::ifstream in(config_path);
            data_ = json::parse(in);
            if (!data_.is_object()) {
                spdlog::error("[WizardConfig] {} does not hold a JSON object", config_path);
                corrupt = true;
            }
        } catch (const json::exception& e) {
            spdlog::error("[WizardConfig] Failed to parse {}: {}", config_path, e.what());
            corrupt = true;
        }

        if (corrupt) {
            spdlog::warn("[WizardConfig] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[WizardConfig] Corrupt config backed up to {}", backup_path);
            }

            data_ = default_config();
            modified = true;
            ok = false;
        }
    } else {
        spdlog::info("[WizardConfig] Creating default config at {}", config_path);
        data_ = default_config();
        modified = true;

        fs::path config_dir = fs::path(config_path).parent_path();
        if (!config_dir.empty()) {
            fs::create_directories(config_dir, ec);
        }
    }

    if (backfill_defaults(data_, default_config())) {
        modified = true;
    }

    if (modified && !save()) {
        ok = false;
    }
    return ok;
}

json& WizardConfig::get_json(const std::string& json_ptr) {
    return data_[json::json_pointer(json_ptr)];
}

bool WizardConfig::save() const {
    if (path_.empty()) {
        LOG_WARN_INTERNAL("WizardConfig::save() called before init()");
        return false;
    }

    spdlog::trace("[WizardConfig] Saving config to {}", path_);
    try {
        std::ofstream o(path_);
        if (!o.is_open()) {
            LOG_ERROR_INTERNAL("Failed to open config file for writing: {}", path_);
            return false;
        }

        o << std::setw(2) << data_ << std::endl;

        if (!o.good()) {
            LOG_ERROR_INTERNAL("Error writing to config file: {}", path_);
            return false;
        }
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("Failed to save config {}: {}", path_, e.what());
        return false;
    }
    return true;
}

std::string WizardConfig::drafts_directory() const {
    std::string dir = get<std::string>("/drafts/directory", "");
    if (!dir.empty()) {
        return dir;
    }
    return data_dir() + "/drafts";
}

logging::LogConfig WizardConfig::log_config() const {
    logging::LogConfig config;
    config.level = logging::parse_log_level(get<std::string>("/log_level", "info"));
    const std::string target = get<std::string>("/log_target", "console");
    config.target = logging::parse_log_target(target);
    if (target != logging::log_target_name(config.target)) {
        spdlog::warn("[WizardConfig] Unknown log_target '{}', using console", target);
    }
    config.file_path = get<std::string>("/log_file", "");
    return config;
}

HttpStepServiceConfig WizardConfig::remote_config() const {
    HttpStepServiceConfig config;
    config.base_url = get<std::string>("/remote/base_url", "");
    config.timeout_sec = get<int>("/remote/timeout_sec", 30);
    config.bearer_token = get<std::string>("/remote/bearer_token", "");

    json::json_pointer endpoints_ptr("/remote/endpoints");
    if (data_.contains(endpoints_ptr) && data_.at(endpoints_ptr).is_object()) {
        for (const auto& item : data_.at(endpoints_ptr).items()) {
            if (item.value().is_string()) {
                config.endpoints[item.key()] = item.value().get<std::string>();
            } else {
                spdlog::warn("[WizardConfig] Ignoring non-string endpoint for '{}'", item.key());
            }
        }
    }
    return config;
}

WizardControllerOptions WizardConfig::controller_options() const {
    WizardControllerOptions options;
    options.delete_draft_on_finish = get<bool>("/drafts/delete_on_finish", false);
    options.delete_draft_on_cancel = get<bool>("/drafts/delete_on_cancel", false);
    return options;
}

} // namespace waypoint
