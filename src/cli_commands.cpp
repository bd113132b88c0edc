#include "cli_commands.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>
#include <nlohmann/json.hpp>

#include "logger.hpp"
#include "state_store.hpp"

namespace cli {

namespace {

void print_json(const nlohmann::json& j, std::ostream& out) {
    out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

std::string flags_of(const RepoRecord& r) {
    if (!r.status)
        return "not refreshed";
    const StatusSummary& s = *r.status;
    if (s.inaccessible)
        return "inaccessible";
    std::string f;
    auto add = [&f](const std::string& part) {
        if (!f.empty())
            f += ' ';
        f += part;
    };
    if (s.conflicted_count > 0)
        add(std::to_string(s.conflicted_count) + " conflicted");
    if (s.staged_count > 0)
        add(std::to_string(s.staged_count) + " staged");
    if (s.modified_count > 0)
        add(std::to_string(s.modified_count) + " modified");
    if (s.untracked_count > 0)
        add(std::to_string(s.untracked_count) + " untracked");
    if (s.merge_in_progress)
        add("merging");
    if (s.rebase_in_progress)
        add("rebasing");
    if (!s.has_upstream && !s.detached)
        add("no upstream");
    return f.empty() ? "clean" : f;
}

std::string branch_of(const RepoRecord& r) {
    if (!r.status)
        return "-";
    const StatusSummary& s = *r.status;
    std::string b = s.branch;
    if (s.ahead > 0)
        b += " +" + std::to_string(s.ahead);
    if (s.behind > 0)
        b += " -" + std::to_string(s.behind);
    return b;
}

std::string location_of(const RepoRecord& r) {
    if (r.environment.is_guest())
        return r.environment.guest + ":" + r.path;
    return r.path;
}

std::string snapshot_signature(const Snapshot& s) {
    std::string sig;
    for (const auto& r : s.repos) {
        sig += r.id;
        sig += r.status ? r.status->refreshed_at : std::string("-");
        sig += r.active_operation ? r.active_operation->id : std::string();
        sig += ';';
    }
    return sig;
}

bool want_args(const Options& opts, size_t n, const char* usage, std::ostream& err) {
    if (opts.args.size() == n)
        return true;
    err << "Usage: kachina " << usage << "\n";
    return false;
}

bool settings_requested(const SettingsUpdate& u) {
    return u.native_roots || u.guest_roots || u.ignore_patterns || u.ignored_repos ||
           u.native_editor || u.guest_editor || u.refresh_interval_seconds ||
           u.fetch_on_refresh;
}

} // namespace

std::optional<std::string> resolve_repository(const Snapshot& snapshot, const std::string& ref) {
    for (const auto& r : snapshot.repos) {
        if (r.id == ref)
            return r.id;
    }
    for (const auto& r : snapshot.repos) {
        if (r.name == ref)
            return r.id;
    }
    for (const auto& r : snapshot.repos) {
        if (r.path == ref || location_of(r) == ref ||
            r.path == normalize_repo_path(r.environment, ref))
            return r.id;
    }
    return std::nullopt;
}

void print_transcript(const Transcript& t, std::ostream& out) {
    out << "$ " << t.command << "\n";
    out << "  started " << t.started_at << ", finished " << t.finished_at << ", exit "
        << (t.exit_code ? std::to_string(*t.exit_code) : std::string("none"))
        << (t.timed_out ? " (timed out)" : "") << "\n";
    if (!t.stdout_text.empty())
        out << "--- stdout\n" << t.stdout_text << (t.stdout_text.back() == '\n' ? "" : "\n");
    if (!t.stderr_text.empty())
        out << "--- stderr\n" << t.stderr_text << (t.stderr_text.back() == '\n' ? "" : "\n");
}

int report_result(const RepoActionResult& result, bool show_transcript, std::ostream& out) {
    out << (result.ok ? "[ok] " : "[failed] ") << result.message << "\n";
    if (result.transcript && (!result.ok || show_transcript))
        print_transcript(*result.transcript, out);
    return result.ok ? 0 : 1;
}

void print_snapshot(const Snapshot& snapshot, std::ostream& out) {
    if (snapshot.repos.empty()) {
        out << "No repositories registered.\n";
        return;
    }
    size_t name_w = 4;
    size_t branch_w = 6;
    for (const auto& r : snapshot.repos) {
        name_w = std::max(name_w, r.name.size());
        branch_w = std::max(branch_w, branch_of(r).size());
    }
    for (const auto& r : snapshot.repos) {
        bool attention = r.status && r.status->needs_attention;
        out << (attention ? "! " : "  ") << std::left << std::setw(static_cast<int>(name_w) + 2)
            << r.name << std::setw(static_cast<int>(branch_w) + 2) << branch_of(r) << flags_of(r);
        if (r.active_operation)
            out << "  [" << r.active_operation->name << "]";
        out << "\n    " << r.id << "  " << location_of(r) << "\n";
        if (!r.last_error.empty())
            out << "    error: " << r.last_error << "\n";
    }
}

void print_settings(const Settings& s, std::ostream& out) {
    auto list = [](const std::vector<std::string>& items) {
        std::string joined;
        for (const auto& i : items) {
            if (!joined.empty())
                joined += ", ";
            joined += i;
        }
        return joined.empty() ? std::string("(none)") : joined;
    };
    std::vector<std::string> guest_roots;
    for (const auto& g : s.guest_roots)
        guest_roots.push_back(g.guest + ":" + g.path);
    out << "native roots:     " << list(s.native_roots) << "\n"
        << "guest roots:      " << list(guest_roots) << "\n"
        << "ignore patterns:  " << list(s.ignore_patterns) << "\n"
        << "ignored repos:    " << list(s.ignored_repos) << "\n"
        << "native editor:    " << s.native_editor << "\n"
        << "guest editor:     " << s.guest_editor << "\n"
        << "refresh interval: " << s.refresh_interval_seconds << "s (effective "
        << effective_refresh_interval(s) << "s)\n"
        << "fetch on refresh: " << (s.fetch_on_refresh ? "yes" : "no") << "\n";
}

int run_watch(RepoEngine& engine, const std::atomic<bool>& running, bool json,
              std::ostream& out) {
    Snapshot snap = engine.refresh_all();
    std::string last = snapshot_signature(snap);
    json ? print_json(snap, out) : print_snapshot(snap, out);
    out.flush();
    engine.start_auto_refresh();
    while (running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        snap = engine.snapshot();
        std::string sig = snapshot_signature(snap);
        if (sig == last)
            continue;
        last = sig;
        if (json) {
            print_json(snap, out);
        } else {
            out << "\n-- " << snap.generated_at << "\n";
            print_snapshot(snap, out);
        }
        out.flush();
    }
    engine.stop_auto_refresh();
    return 0;
}

int run_command(const Options& opts, RepoEngine& engine, std::ostream& out, std::ostream& err) {
    const std::string& cmd = opts.command;
    auto emit = [&](const RepoActionResult& r) {
        if (opts.json_output) {
            print_json(r, out);
            return r.ok ? 0 : 1;
        }
        return report_result(r, opts.show_transcript, out);
    };
    auto emit_snapshot = [&](const Snapshot& s) {
        opts.json_output ? print_json(s, out) : print_snapshot(s, out);
        return 0;
    };
    // Repository argument -> id, reporting the engine's not-found result otherwise.
    auto with_repo = [&](auto&& action) {
        auto id = resolve_repository(engine.snapshot(), opts.args.front());
        return emit(action(id ? *id : opts.args.front()));
    };

    if (cmd == "list")
        return emit_snapshot(engine.snapshot());
    if (cmd == "refresh") {
        if (opts.args.empty())
            return emit_snapshot(engine.refresh_all());
        if (!want_args(opts, 1, "refresh [REPO]", err))
            return 2;
        return with_repo([&](const std::string& id) { return engine.refresh_repository(id); });
    }
    if (cmd == "scan")
        return emit_snapshot(engine.scan_configured_roots());
    if (cmd == "add") {
        if (!want_args(opts, 1, "add PATH [--guest GUEST] [--name NAME]", err))
            return 2;
        return emit(engine.add_repository(AddRepoInput{opts.args[0], opts.guest, opts.name}));
    }
    if (cmd == "remove") {
        if (!want_args(opts, 1, "remove REPO", err))
            return 2;
        return with_repo([&](const std::string& id) { return engine.remove_repository(id); });
    }
    if (cmd == "stage" || cmd == "unstage") {
        if (!want_args(opts, 2, (cmd + " REPO FILE").c_str(), err))
            return 2;
        return with_repo([&](const std::string& id) {
            return cmd == "stage" ? engine.stage_file(id, opts.args[1])
                                  : engine.unstage_file(id, opts.args[1]);
        });
    }
    if (cmd == "commit") {
        if (!want_args(opts, 1, "commit REPO -m MESSAGE", err))
            return 2;
        return with_repo([&](const std::string& id) {
            return engine.commit_repository(id, opts.message.value_or(std::string()));
        });
    }
    if (cmd == "push" || cmd == "sync") {
        if (!want_args(opts, 1, (cmd + " REPO").c_str(), err))
            return 2;
        return with_repo([&](const std::string& id) {
            return cmd == "push" ? engine.push_repository(id) : engine.sync_repository(id);
        });
    }
    if (cmd == "open-editor" || cmd == "open-files" || cmd == "open-terminal") {
        if (!want_args(opts, 1, (cmd + " REPO").c_str(), err))
            return 2;
        return with_repo([&](const std::string& id) {
            if (cmd == "open-editor")
                return engine.open_in_editor(id);
            if (cmd == "open-files")
                return engine.open_in_file_manager(id);
            return engine.open_in_terminal(id);
        });
    }
    if (cmd == "cancel") {
        if (!want_args(opts, 1, "cancel REPO", err))
            return 2;
        auto id = resolve_repository(engine.snapshot(), opts.args.front());
        if (!id) {
            err << "Repository not found.\n";
            return 1;
        }
        return emit_snapshot(engine.cancel_repository_operation(*id));
    }
    if (cmd == "settings") {
        Snapshot s =
            settings_requested(opts.settings) ? engine.update_settings(opts.settings)
                                              : engine.snapshot();
        if (opts.json_output)
            print_json(s.settings, out);
        else
            print_settings(s.settings, out);
        return 0;
    }
    if (cmd == "transcript") {
        if (!want_args(opts, 1, "transcript REPO", err))
            return 2;
        auto id = resolve_repository(engine.snapshot(), opts.args.front());
        auto record = id ? engine.find(*id) : std::nullopt;
        if (!record) {
            err << "Repository not found.\n";
            return 1;
        }
        if (opts.json_output) {
            print_json(nlohmann::json{{"lastFailure", record->last_failure
                                                          ? nlohmann::json(*record->last_failure)
                                                          : nlohmann::json(nullptr)},
                                      {"history", record->history}},
                       out);
            return 0;
        }
        if (record->last_failure) {
            out << "Last failure:\n";
            print_transcript(*record->last_failure, out);
        }
        out << "History (" << record->history.size() << "):\n";
        for (const auto& t : record->history)
            print_transcript(t, out);
        return 0;
    }
    err << "Unknown command: " << cmd << "\n";
    return 2;
}

} // namespace cli
