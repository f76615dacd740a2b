// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file waypoint_replay.cpp
 * @brief Drive a JSON-defined wizard from a command script
 *
 * Usage: waypoint-replay --definition wizard.json [--config cfg.json]
 *                        [--script cmds.txt] [--dry-run] [-v|-vv|-vvv]
 *
 * Commands (one per line, '#' starts a comment):
 *   set <field> <json>   Edit a field of the current step
 *   next | back | finish
 *   save | load <id> | drafts
 *   cancel [--confirm]
 *   reauth [token]       Lift an auth halt (optionally with a new bearer token)
 *   reset | status
 *
 * Without --script, commands are read from stdin.
 */

#include "completion_queue.h"
#include "file_draft_store.h"
#include "form_step.h"
#include "http_step_service.h"
#include "logging_init.h"
#include "utils/identity.h"
#include "wizard_config.h"
#include "wizard_controller.h"
#include "wizard_definition.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "hv/json.hpp"

using json = nlohmann::json;
using namespace waypoint;

namespace {

struct ReplayArgs {
    std::string definition_path;
    std::string config_path;
    std::string script_path;
    bool dry_run = false;
    int verbosity = -1; ///< -1 = use config log_level
};

void print_help(const char* program_name) {
    printf("Usage: %s --definition <file> [options]\n", program_name);
    printf("Options:\n");
    printf("  -d, --definition <file>  Wizard definition (JSON)\n");
    printf("  -c, --config <file>      Config file (created with defaults if missing)\n");
    printf("  -s, --script <file>      Command script (default: stdin)\n");
    printf("  -n, --dry-run            Answer remote operations in-process\n");
    printf("  -v, --verbose            Increase log verbosity (-v info, -vv debug, -vvv trace)\n");
    printf("  -h, --help               Show this help\n");
}

bool parse_args(int argc, char** argv, ReplayArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                printf("Error: %s requires an argument\n", name);
                return nullptr;
            }
            return argv[++i];
        };

        if (strcmp(arg, "-d") == 0 || strcmp(arg, "--definition") == 0) {
            const char* v = need_value(arg);
            if (!v)
                return false;
            args.definition_path = v;
        } else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
            const char* v = need_value(arg);
            if (!v)
                return false;
            args.config_path = v;
        } else if (strcmp(arg, "-s") == 0 || strcmp(arg, "--script") == 0) {
            const char* v = need_value(arg);
            if (!v)
                return false;
            args.script_path = v;
        } else if (strcmp(arg, "-n") == 0 || strcmp(arg, "--dry-run") == 0) {
            args.dry_run = true;
        } else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            args.verbosity = (args.verbosity < 0 ? 0 : args.verbosity) + 1;
        } else if (strcmp(arg, "-vv") == 0) {
            args.verbosity = 2;
        } else if (strcmp(arg, "-vvv") == 0) {
            args.verbosity = 3;
        } else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            exit(0);
        } else {
            printf("Unknown argument: %s\n", arg);
            print_help(argv[0]);
            return false;
        }
    }

    if (args.definition_path.empty()) {
        printf("Error: --definition is required\n");
        print_help(argv[0]);
        return false;
    }
    return true;
}

/// Answers every operation immediately with generated identifiers
class DryRunStepService : public RemoteStepService {
  public:
    explicit DryRunStepService(std::map<std::string, std::vector<std::string>> identifiers)
        : identifiers_(std::move(identifiers)) {}

    void execute(const std::string& operation, const json& /*payload*/,
                 SuccessCallback on_success, ErrorCallback /*on_error*/) override {
        json ids = json::object();
        auto it = identifiers_.find(operation);
        if (it != identifiers_.end()) {
            for (const auto& key : it->second) {
                ids[key] = "DRY-" + random_hex(8);
            }
        }
        spdlog::info("[DryRun] {} -> {}", operation, ids.dump());
        on_success(ids);
    }

  private:
    std::map<std::string, std::vector<std::string>> identifiers_;
};

/// Prints controller events to stdout
class ConsoleListener : public WizardListener {
  public:
    void on_state_changed(WizardState state) override {
        std::cout << "  state: " << wizard_state_name(state) << "\n";
    }

    void on_step_changed(size_t index, const WizardStep& step) override {
        std::cout << "  step " << index + 1 << ": " << step.title() << " [" << step.id()
                  << "]\n";
    }

    void on_validation_failed(const std::string& step_id, const ValidationResult& result) override {
        std::cout << "  " << step_id << " invalid:\n";
        for (const auto& e : result.errors) {
            std::cout << "    - " << (e.field.empty() ? "(form)" : e.field) << ": " << e.message
                      << "\n";
        }
    }

    void on_error(const WizardError& error) override {
        std::cout << "  error [" << error.get_kind_string() << "] " << error.user_message()
                  << "\n";
    }

    void on_draft_saved(const std::string& draft_id) override {
        std::cout << "  draft saved: " << draft_id << "\n";
    }

    void on_completed(const json& final_snapshot) override {
        std::cout << "  completed " << final_snapshot.value("reference_number", "") << "\n";
        std::cout << final_snapshot.dump(2) << "\n";
    }

    void on_cancelled() override {
        std::cout << "  cancelled\n";
    }
};

class ReplaySession {
  public:
    ReplaySession(WizardController& controller, CompletionQueue& queue,
                  std::shared_ptr<DraftStore> drafts, HttpStepService* http, int timeout_sec)
        : controller_(controller), queue_(queue), drafts_(std::move(drafts)), http_(http),
          timeout_sec_(timeout_sec) {}

    /// @return false if the command was not understood
    bool run(const std::string& line) {
        std::istringstream in(line);
        std::string cmd;
        in >> cmd;
        if (cmd.empty() || cmd[0] == '#') {
            return true;
        }
        std::cout << "> " << line << "\n";

        if (cmd == "set") {
            std::string field;
            in >> field;
            std::string raw;
            std::getline(in, raw);
            set_field(field, trim(raw));
        } else if (cmd == "next") {
            report(controller_.next());
        } else if (cmd == "back") {
            report(controller_.previous());
        } else if (cmd == "finish") {
            report(controller_.finish());
        } else if (cmd == "save") {
            auto status = controller_.save_draft([](DraftSaveStatus s, const std::string& id) {
                if (s != DraftSaveStatus::Saved) {
                    std::cout << "  save: " << draft_save_status_name(s) << "\n";
                } else {
                    spdlog::debug("[Replay] Saved {}", id);
                }
            });
            if (status == DraftSaveStatus::Deferred) {
                std::cout << "  save deferred\n";
            }
        } else if (cmd == "load") {
            std::string id;
            in >> id;
            std::cout << "  load: " << draft_load_status_name(controller_.load_draft(id)) << "\n";
        } else if (cmd == "drafts") {
            list_drafts();
        } else if (cmd == "cancel") {
            std::string flag;
            in >> flag;
            auto result = controller_.cancel(flag == "--confirm");
            if (result == CancelResult::ConfirmationRequired) {
                std::cout << "  committed steps exist; use 'cancel --confirm'\n";
            } else if (result == CancelResult::InvalidState) {
                std::cout << "  nothing to cancel\n";
            }
        } else if (cmd == "reauth") {
            std::string token;
            in >> token;
            if (!token.empty() && http_) {
                http_->set_bearer_token(token);
            }
            report(controller_.notify_reauthenticated());
        } else if (cmd == "reset") {
            report(controller_.reset());
        } else if (cmd == "status") {
            print_status();
        } else {
            std::cout << "  unknown command '" << cmd << "'\n";
            return false;
        }

        pump();
        return true;
    }

  private:
    static std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t");
        if (start == std::string::npos) {
            return "";
        }
        size_t end = s.find_last_not_of(" \t\r");
        return s.substr(start, end - start + 1);
    }

    void set_field(const std::string& field, const std::string& raw) {
        auto* form = dynamic_cast<FormStep*>(&controller_.current_step());
        if (!form) {
            std::cout << "  current step has no editable fields\n";
            return;
        }

        // Accept JSON literals; anything else is taken as a plain string
        json value;
        try {
            value = json::parse(raw);
        } catch (const json::parse_error&) {
            value = raw;
        }

        try {
            form->set_field(field, value);
        } catch (const std::invalid_argument& e) {
            std::cout << "  " << e.what() << "\n";
        }
    }

    void report(CommandStatus status) {
        if (status != CommandStatus::Accepted) {
            std::cout << "  " << command_status_name(status) << "\n";
        }
    }

    /// Run queued completions until the controller is idle
    void pump() {
        auto deadline =
            std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec_ + 5);
        queue_.process_pending();
        while (controller_.is_busy() && std::chrono::steady_clock::now() < deadline) {
            queue_.wait_for_pending(std::chrono::milliseconds(100));
            queue_.process_pending();
        }
        if (controller_.is_busy()) {
            spdlog::warn("[Replay] Controller still busy after {}s", timeout_sec_ + 5);
        }
    }

    void list_drafts() {
        if (!drafts_) {
            std::cout << "  no draft store\n";
            return;
        }
        auto ids = drafts_->list_ids();
        if (ids.empty()) {
            std::cout << "  (no drafts)\n";
        }
        for (const auto& id : ids) {
            auto record = drafts_->load(id);
            if (!record) {
                std::cout << "  " << id << " (unreadable)\n";
                continue;
            }
            std::cout << "  " << id << "  " << record->reference_number << "  step "
                      << record->current_step_index + 1 << "  updated " << record->updated_at
                      << (record->completed ? "  [completed]" : "") << "\n";
        }
    }

    void print_status() {
        const auto& ctx = controller_.context();
        std::cout << "  state:     " << wizard_state_name(controller_.state())
                  << (controller_.is_busy() ? " (busy)" : "") << "\n";
        std::cout << "  reference: " << ctx.reference_number() << "\n";
        if (controller_.state() != WizardState::NotStarted) {
            const auto& nav = controller_.navigator();
            std::cout << "  step:      " << nav.current() + 1 << "/" << nav.step_count() << " ("
                      << nav.progress_percent() << "%) " << controller_.current_step().title()
                      << "\n";
        }
        const std::string& draft = controller_.draft_id();
        std::cout << "  draft:     " << (draft.empty() ? std::string("-") : draft) << "\n";
        for (const auto& key : ctx.keys()) {
            std::cout << "    " << key << " = " << ctx.get(key).dump()
                      << (ctx.is_finalized(key) ? "  (final)" : "") << "\n";
        }
        if (controller_.last_error().has_error()) {
            std::cout << "  last error: " << controller_.last_error().user_message() << "\n";
        }
    }

    WizardController& controller_;
    CompletionQueue& queue_;
    std::shared_ptr<DraftStore> drafts_;
    HttpStepService* http_ = nullptr;
    int timeout_sec_ = 30;
};

} // namespace

int main(int argc, char** argv) {
    ReplayArgs args;
    if (!parse_args(argc, argv, args)) {
        return 2;
    }

    WizardConfig config;
    if (!args.config_path.empty() && !config.init(args.config_path)) {
        fprintf(stderr, "Warning: config %s had problems, continuing with defaults\n",
                args.config_path.c_str());
    }

    logging::LogConfig log_config = config.log_config();
    if (args.verbosity >= 0) {
        log_config.level = logging::verbosity_to_level(args.verbosity);
    }
    logging::init(log_config);

    WizardDefinition definition;
    try {
        definition = WizardDefinition::load_file(args.definition_path);
    } catch (const std::exception& e) {
        spdlog::error("[Replay] {}", e.what());
        return 1;
    }

    CompletionQueue queue;
    std::shared_ptr<RemoteStepService> service;
    HttpStepService* http = nullptr;
    HttpStepServiceConfig remote = config.remote_config();

    if (args.dry_run) {
        std::map<std::string, std::vector<std::string>> identifiers;
        for (const auto& step : definition.steps()) {
            if (!step.operation.empty()) {
                identifiers[step.operation] = step.expected_identifiers;
            }
        }
        service = std::make_shared<DryRunStepService>(std::move(identifiers));
    } else if (definition.has_remote_steps() || !definition.finish_operation().empty()) {
        if (remote.base_url.empty()) {
            spdlog::error("[Replay] remote.base_url is not configured (use --dry-run to test)");
            return 1;
        }
        auto http_service = std::make_shared<HttpStepService>(remote, &queue);
        http = http_service.get();
        service = http_service;
    }

    std::unique_ptr<StepSequence> steps;
    try {
        steps = definition.build(service);
    } catch (const std::invalid_argument& e) {
        spdlog::error("[Replay] Invalid definition: {}", e.what());
        return 1;
    }

    auto drafts = std::make_shared<FileDraftStore>(config.drafts_directory());
    WizardController controller(std::move(steps), drafts, config.controller_options());
    ConsoleListener listener;
    controller.set_listener(&listener);
    controller.start();

    ReplaySession session(controller, queue, drafts, http, remote.timeout_sec);

    std::ifstream script;
    if (!args.script_path.empty()) {
        script.open(args.script_path);
        if (!script.good()) {
            spdlog::error("[Replay] Cannot open script {}", args.script_path);
            return 1;
        }
    }
    std::istream& input = args.script_path.empty() ? std::cin : script;

    int unknown = 0;
    std::string line;
    while (std::getline(input, line)) {
        if (!session.run(line)) {
            ++unknown;
        }
    }

    controller.set_listener(nullptr);
    return unknown > 0 ? 1 : 0;
}
