// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "draft_codec.h"

#include "json_utils.h"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace waypoint {

namespace {

std::optional<DraftRecord> fail(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return std::nullopt;
}

} // namespace

json draft_to_json(const DraftRecord& record) {
    json flags = json::object();
    for (const auto& [step_id, committed] : record.guard_flags) {
        flags[step_id] = committed;
    }

    return json{{"version", DRAFT_FORMAT_VERSION},
                {"id", record.id},
                {"reference_number", record.reference_number},
                {"created_at", record.created_at},
                {"updated_at", record.updated_at},
                {"completed", record.completed},
                {"current_step_index", record.current_step_index},
                {"guard_flags", std::move(flags)},
                {"context", record.context_snapshot},
                {"step_data", record.step_data.is_object() ? record.step_data : json::object()}};
}

std::optional<DraftRecord> draft_from_json(const json& j, std::string* error) {
    if (!j.is_object()) {
        return fail(error, "draft is not a JSON object");
    }

    int version = j.contains("version") && j["version"].is_number_integer()
                      ? j["version"].get<int>()
                      : 0;
    if (version < 1 || version > DRAFT_FORMAT_VERSION) {
        return fail(error, "unsupported draft version " + std::to_string(version));
    }

    if (!j.contains("current_step_index") || !j["current_step_index"].is_number_integer() ||
        j["current_step_index"].get<long long>() < 0) {
        return fail(error, "missing or negative current_step_index");
    }
    if (!j.contains("context") || !j["context"].is_object()) {
        return fail(error, "missing context snapshot");
    }

    DraftRecord record;
    record.id = json_util::safe_string(j, "id");
    record.reference_number = json_util::safe_string(j, "reference_number");
    record.created_at = json_util::safe_string(j, "created_at");
    record.updated_at = json_util::safe_string(j, "updated_at");
    record.completed = json_util::safe_bool(j, "completed");
    record.current_step_index = json_util::safe_index(j, "current_step_index");
    record.context_snapshot = j["context"];

    if (j.contains("guard_flags")) {
        const auto& flags = j["guard_flags"];
        if (!flags.is_object()) {
            return fail(error, "guard_flags must be an object");
        }
        for (auto it = flags.begin(); it != flags.end(); ++it) {
            if (!it.value().is_boolean()) {
                return fail(error, "guard flag '" + it.key() + "' is not a boolean");
            }
            record.guard_flags[it.key()] = it.value().get<bool>();
        }
    }

    if (j.contains("step_data") && j["step_data"].is_object()) {
        record.step_data = j["step_data"];
    }

    spdlog::trace("[DraftCodec] Parsed draft {} at step {}", record.id,
                  record.current_step_index);
    return record;
}

} // namespace waypoint
