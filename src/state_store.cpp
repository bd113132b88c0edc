#include "state_store.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "logger.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr int kStateVersion = 1;

template <typename T> void read_optional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        out.reset();
    else
        out = it->template get<T>();
}

std::string char_string(char c) { return std::string(1, c); }

char first_char(const json& j, const char* key) {
    std::string s = j.value(key, std::string(" "));
    return s.empty() ? ' ' : s[0];
}

} // namespace

void to_json(json& j, const Transcript& t) {
    j = json{{"command", t.command},
             {"exitCode", t.exit_code ? json(*t.exit_code) : json(nullptr)},
             {"stdout", t.stdout_text},
             {"stderr", t.stderr_text},
             {"startedAt", t.started_at},
             {"finishedAt", t.finished_at},
             {"timedOut", t.timed_out}};
}

void from_json(const json& j, Transcript& t) {
    t.command = j.at("command").get<std::string>();
    read_optional(j, "exitCode", t.exit_code);
    t.stdout_text = j.value("stdout", std::string());
    t.stderr_text = j.value("stderr", std::string());
    t.started_at = j.value("startedAt", std::string());
    t.finished_at = j.value("finishedAt", std::string());
    t.timed_out = j.value("timedOut", false);
}

void to_json(json& j, const RepoEnvironment& e) {
    if (e.is_guest())
        j = json{{"kind", "guest"}, {"guest", e.guest}};
    else
        j = json{{"kind", "native"}};
}

void from_json(const json& j, RepoEnvironment& e) {
    const std::string kind = j.at("kind").get<std::string>();
    if (kind == "guest")
        e = RepoEnvironment::guest_of(j.at("guest").get<std::string>());
    else if (kind == "native")
        e = RepoEnvironment::native();
    else
        throw std::invalid_argument("unknown environment kind: " + kind);
}

void to_json(json& j, const ChangedFile& f) {
    j = json{{"path", f.path},
             {"indexStatus", char_string(f.index_status)},
             {"worktreeStatus", char_string(f.worktree_status)},
             {"untracked", f.untracked},
             {"staged", f.staged},
             {"unstaged", f.unstaged},
             {"conflicted", f.conflicted}};
}

void from_json(const json& j, ChangedFile& f) {
    f.path = j.at("path").get<std::string>();
    f.index_status = first_char(j, "indexStatus");
    f.worktree_status = first_char(j, "worktreeStatus");
    f.untracked = j.value("untracked", false);
    f.staged = j.value("staged", false);
    f.unstaged = j.value("unstaged", false);
    f.conflicted = j.value("conflicted", false);
}

void to_json(json& j, const StatusSummary& s) {
    j = json{{"needsAttention", s.needs_attention},
             {"dirty", s.dirty},
             {"hasStaged", s.has_staged},
             {"hasUntracked", s.has_untracked},
             {"stagedCount", s.staged_count},
             {"modifiedCount", s.modified_count},
             {"untrackedCount", s.untracked_count},
             {"conflictedCount", s.conflicted_count},
             {"changedFiles", s.changed_files},
             {"branch", s.branch},
             {"detached", s.detached},
             {"hasUpstream", s.has_upstream},
             {"ahead", s.ahead},
             {"behind", s.behind},
             {"mergeInProgress", s.merge_in_progress},
             {"rebaseInProgress", s.rebase_in_progress},
             {"inaccessible", s.inaccessible},
             {"refreshedAt", s.refreshed_at}};
}

void from_json(const json& j, StatusSummary& s) {
    s.needs_attention = j.value("needsAttention", false);
    s.dirty = j.value("dirty", false);
    s.has_staged = j.value("hasStaged", false);
    s.has_untracked = j.value("hasUntracked", false);
    s.staged_count = j.value("stagedCount", 0);
    s.modified_count = j.value("modifiedCount", 0);
    s.untracked_count = j.value("untrackedCount", 0);
    s.conflicted_count = j.value("conflictedCount", 0);
    s.changed_files = j.value("changedFiles", std::vector<ChangedFile>{});
    s.branch = j.value("branch", std::string("detached"));
    s.detached = j.value("detached", false);
    s.has_upstream = j.value("hasUpstream", false);
    s.ahead = j.value("ahead", 0);
    s.behind = j.value("behind", 0);
    s.merge_in_progress = j.value("mergeInProgress", false);
    s.rebase_in_progress = j.value("rebaseInProgress", false);
    s.inaccessible = j.value("inaccessible", false);
    s.refreshed_at = j.value("refreshedAt", std::string());
}

void to_json(json& j, const ActiveOperation& op) {
    j = json{{"id", op.id}, {"name", op.name}, {"startedAt", op.started_at}};
}

void to_json(json& j, const RepoRecord& r) {
    j = json{{"id", r.id},
             {"name", r.name},
             {"path", r.path},
             {"environment", r.environment},
             {"createdAt", r.created_at},
             {"updatedAt", r.updated_at},
             {"status", r.status ? json(*r.status) : json(nullptr)},
             {"activeOperation",
              r.active_operation ? json(*r.active_operation) : json(nullptr)},
             {"lastError", r.last_error.empty() ? json(nullptr) : json(r.last_error)},
             {"lastFailure", r.last_failure ? json(*r.last_failure) : json(nullptr)},
             {"history", r.history}};
}

void from_json(const json& j, RepoRecord& r) {
    r.id = j.at("id").get<std::string>();
    r.path = j.at("path").get<std::string>();
    r.name = j.value("name", default_display_name(r.path));
    r.environment = j.at("environment").get<RepoEnvironment>();
    r.created_at = j.value("createdAt", std::string());
    r.updated_at = j.value("updatedAt", std::string());
    read_optional(j, "status", r.status);
    r.active_operation.reset();
    auto err = j.find("lastError");
    r.last_error = err != j.end() && err->is_string() ? err->get<std::string>() : std::string();
    read_optional(j, "lastFailure", r.last_failure);
    r.history.clear();
    if (auto h = j.find("history"); h != j.end() && h->is_array()) {
        for (const auto& item : *h)
            push_history(r, item.get<Transcript>());
    }
}

void to_json(json& j, const GuestRoot& g) {
    j = json{{"id", g.id}, {"guest", g.guest}, {"path", g.path}};
}

void from_json(const json& j, GuestRoot& g) {
    g.id = j.value("id", std::string());
    if (g.id.empty())
        g.id = new_id("root");
    g.guest = j.at("guest").get<std::string>();
    g.path = j.at("path").get<std::string>();
}

void to_json(json& j, const Settings& s) {
    j = json{{"nativeRoots", s.native_roots},
             {"guestRoots", s.guest_roots},
             {"ignorePatterns", s.ignore_patterns},
             {"ignoredRepos", s.ignored_repos},
             {"nativeEditor", s.native_editor},
             {"guestEditor", s.guest_editor},
             {"refreshIntervalSeconds", s.refresh_interval_seconds},
             {"fetchOnRefresh", s.fetch_on_refresh}};
}

void from_json(const json& j, Settings& s) {
    const Settings defaults;
    s.native_roots = j.value("nativeRoots", defaults.native_roots);
    s.guest_roots = j.value("guestRoots", defaults.guest_roots);
    s.ignore_patterns = j.value("ignorePatterns", defaults.ignore_patterns);
    s.ignored_repos = j.value("ignoredRepos", defaults.ignored_repos);
    s.native_editor = j.value("nativeEditor", defaults.native_editor);
    s.guest_editor = j.value("guestEditor", defaults.guest_editor);
    s.refresh_interval_seconds =
        j.value("refreshIntervalSeconds", defaults.refresh_interval_seconds);
    s.fetch_on_refresh = j.value("fetchOnRefresh", defaults.fetch_on_refresh);
}

void to_json(json& j, const Snapshot& s) {
    j = json{{"repos", s.repos}, {"settings", s.settings}, {"generatedAt", s.generated_at}};
}

void to_json(json& j, const RepoActionResult& r) {
    j = json{{"ok", r.ok},
             {"message", r.message},
             {"transcript", r.transcript ? json(*r.transcript) : json(nullptr)},
             {"snapshot", r.snapshot}};
}

PersistedState JsonStateStore::load() {
    PersistedState state;
    std::error_code ec;
    if (!fs::exists(path_, ec))
        return state;
    try {
        std::ifstream ifs(path_);
        if (!ifs)
            throw std::runtime_error("cannot open file");
        json root;
        ifs >> root;
        if (!root.is_object())
            throw std::runtime_error("root is not an object");
        if (auto s = root.find("settings"); s != root.end() && s->is_object())
            state.settings = s->get<Settings>();
        if (auto r = root.find("repos"); r != root.end() && r->is_array())
            state.repos = r->get<std::vector<RepoRecord>>();
    } catch (const std::exception& e) {
        if (logger_initialized())
            log_warning("State file unreadable, using defaults",
                        {{"path", path_.string()}, {"error", e.what()}});
        return PersistedState{};
    }
    return state;
}

bool JsonStateStore::save(const PersistedState& state) {
    std::lock_guard<std::mutex> lk(write_mtx_);
    std::error_code ec;
    if (path_.has_parent_path())
        fs::create_directories(path_.parent_path(), ec);
    // Git output is not guaranteed to be UTF-8; invalid bytes become U+FFFD.
    std::string text;
    try {
        json root{{"version", kStateVersion}, {"settings", state.settings}, {"repos", json::array()}};
        for (RepoRecord r : state.repos) {
            r.active_operation.reset();
            root["repos"].push_back(r);
        }
        text = root.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        if (logger_initialized())
            log_error("Cannot serialize state", {{"path", path_.string()}, {"error", e.what()}});
        return false;
    }
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            if (logger_initialized())
                log_error("Cannot write state file", {{"path", tmp.string()}});
            return false;
        }
        ofs << text << '\n';
        if (!ofs) {
            if (logger_initialized())
                log_error("Short write on state file", {{"path", tmp.string()}});
            ofs.close();
            fs::remove(tmp, ec);
            return false;
        }
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
        if (logger_initialized())
            log_error("Cannot replace state file",
                      {{"path", path_.string()}, {"error", ec.message()}});
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}
