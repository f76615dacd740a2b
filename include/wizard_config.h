// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file wizard_config.h
 * @brief JSON configuration file for waypoint tools
 *
 * Values are addressed with JSON pointers ("/drafts/directory"). Missing
 * files are created with defaults and missing keys are back-filled on init().
 *
 * @code
 * {
 *   "log_level": "info",
 *   "log_target": "console",
 *   "log_file": "",
 *   "wizard": {"reference_prefix": "WIZ"},
 *   "drafts": {"directory": "", "delete_on_finish": false, "delete_on_cancel": false},
 *   "remote": {"base_url": "", "timeout_sec": 30, "bearer_token": "", "endpoints": {}}
 * }
 * @endcode
 */

#include "http_step_service.h"
#include "logging_init.h"
#include "wizard_controller.h"

#include <spdlog/spdlog.h>

#include <string>

#include "hv/json.hpp"

namespace waypoint {

class WizardConfig {
  public:
    WizardConfig();

    WizardConfig(const WizardConfig&) = delete;
    WizardConfig& operator=(const WizardConfig&) = delete;

    /**
     * @brief Load (or create) the config file
     *
     * A corrupt file is moved aside to <path>.corrupt and replaced by defaults.
     *
     * @return true if the file was loaded or created without errors
     */
    bool init(const std::string& config_path);

    /// Throws nlohmann::json exceptions if the pointer is missing or mistyped
    template <typename T> T get(const std::string& json_ptr) const {
        return data_.at(nlohmann::json::json_pointer(json_ptr)).template get<T>();
    }

    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        nlohmann::json::json_pointer ptr(json_ptr);
        if (data_.contains(ptr)) {
            const auto& v = data_.at(ptr);
            if (!v.is_null()) {
                try {
                    return v.template get<T>();
                } catch (const nlohmann::json::type_error& e) {
                    spdlog::warn("[WizardConfig] {} has the wrong type: {}", json_ptr, e.what());
                }
            }
        }
        return default_value;
    }

    template <typename T> void set(const std::string& json_ptr, const T& value) {
        data_[nlohmann::json::json_pointer(json_ptr)] = value;
    }

    nlohmann::json& get_json(const std::string& json_ptr);

    const nlohmann::json& data() const {
        return data_;
    }

    bool save() const;

    const std::string& path() const {
        return path_;
    }

    /// Defaults used for new files and back-filling
    static nlohmann::json default_config();

    /// drafts.directory, or $XDG_DATA_HOME/waypoint/drafts when empty
    std::string drafts_directory() const;

    logging::LogConfig log_config() const;
    HttpStepServiceConfig remote_config() const;
    WizardControllerOptions controller_options() const;

  private:
    std::string path_;
    nlohmann::json data_;

    /// Allow test fixture to access private members
    friend class WizardConfigTestFixture;
};

} // namespace waypoint
