// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "hv/json.hpp"

namespace waypoint::json_util {

/// Safely extract a string from a JSON field that may be missing, null or non-string.
/// nlohmann .value("key", "") throws type_error.302 when the field is JSON null.
inline std::string safe_string(const nlohmann::json& j, const char* key,
                               const std::string& def = "") {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return def;
}

/// Safely extract a bool; accepts true/false only.
inline bool safe_bool(const nlohmann::json& j, const char* key, bool def = false) {
    if (!j.is_object() || !j.contains(key)) {
        return def;
    }
    const auto& v = j[key];
    return v.is_boolean() ? v.get<bool>() : def;
}

/// Safely extract a non-negative index. Negative or non-integer values yield def.
inline size_t safe_index(const nlohmann::json& j, const char* key, size_t def = 0) {
    if (!j.is_object() || !j.contains(key)) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_number_unsigned()) {
        return v.get<size_t>();
    }
    if (v.is_number_integer() && v.get<long long>() >= 0) {
        return static_cast<size_t>(v.get<long long>());
    }
    return def;
}

/// Collect the string elements of an array field, skipping anything else.
inline std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.is_object() || !j.contains(key) || !j[key].is_array()) {
        return out;
    }
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

/// True if a slot value counts as "not filled in" (null, empty string/array/object).
inline bool is_blank(const nlohmann::json& v) {
    if (v.is_null()) {
        return true;
    }
    if (v.is_string()) {
        return v.get<std::string>().empty();
    }
    if (v.is_array() || v.is_object()) {
        return v.empty();
    }
    return false;
}

} // namespace waypoint::json_util
