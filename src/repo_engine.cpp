#include "repo_engine.hpp"

#include <algorithm>
#include <cctype>

#include "errors.hpp"
#include "ignore_utils.hpp"
#include "logger.hpp"
#include "status_parser.hpp"
#include "time_utils.hpp"

using namespace std::chrono_literals;

namespace {

constexpr std::chrono::milliseconds kRefreshFetchTimeout = 45s;
constexpr std::chrono::milliseconds kRefreshStatusTimeout = 30s;
constexpr std::chrono::milliseconds kMarkerProbeTimeout = 10s;
constexpr std::chrono::milliseconds kRefreshQueueTimeout = 60s;
constexpr std::chrono::milliseconds kVerifyTimeout = 10s;
constexpr std::chrono::milliseconds kActionTimeout = 45s;
constexpr std::chrono::milliseconds kPushTimeout = 90s;
constexpr std::chrono::milliseconds kActionQueueSlack = 15s;
constexpr std::chrono::milliseconds kCommitStatusTimeout = 20s;
constexpr std::chrono::milliseconds kStageAllTimeout = 20s;
constexpr std::chrono::milliseconds kCommitTimeout = 45s;
constexpr std::chrono::milliseconds kCommitQueueTimeout = 60s;
constexpr std::chrono::milliseconds kSyncQueueTimeout = 255s;

const std::vector<std::string> kStatusArgs{"status", "--porcelain=v1", "--branch", "-uall"};
const std::vector<std::string> kRefreshFetchArgs{"fetch", "--all", "--prune", "--quiet"};

const char* const kFetchFailed =
    "Fetch failed (see transcript). Status may be stale against upstream.";
const char* const kInaccessible = "Repository inaccessible or git command failed.";

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

StatusSummary inaccessible_summary() {
    StatusSummary s;
    s.needs_attention = true;
    s.branch = "unknown";
    s.inaccessible = true;
    s.refreshed_at = iso_timestamp();
    return s;
}

std::string exit_code_text(const Transcript& t) {
    return t.exit_code ? std::to_string(*t.exit_code) : "unknown";
}

} // namespace

RepoEngine::RepoEngine(StateStore& store, procutil::CommandExecutor& executor,
                       EngineConfig config)
    : store_(store), executor_(executor), bridge_(config.bridge),
      launcher_(executor, [&] {
          launcher::LauncherConfig lc = config.launcher;
          lc.bridge = config.bridge;
          return lc;
      }()),
      queue_(
          [this](const std::string& id, const ActiveOperation& op) {
              with_record(id, [&](RepoRecord& r) { r.active_operation = op; });
          },
          [this](const std::string& id, const std::string& op_id) {
              with_record(id, [&](RepoRecord& r) {
                  if (r.active_operation && r.active_operation->id == op_id)
                      r.active_operation.reset();
              });
          }) {
    PersistedState state = store_.load();
    repos_ = std::move(state.repos);
    settings_ = std::move(state.settings);
    if (logger_initialized())
        log_info("Engine ready", {{"repositories", std::to_string(repos_.size())}});
}

RepoEngine::~RepoEngine() { stop_auto_refresh(); }

template <typename Fn> void RepoEngine::with_record(const std::string& id, Fn&& fn) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = std::find_if(repos_.begin(), repos_.end(),
                           [&](const RepoRecord& r) { return r.id == id; });
    if (it != repos_.end())
        fn(*it);
}

void RepoEngine::record_transcript(const std::string& id, const Transcript& t) {
    with_record(id, [&](RepoRecord& r) { push_history(r, t); });
}

std::optional<RepoEngine::Target> RepoEngine::target_of(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& r : repos_) {
        if (r.id == id)
            return Target{r.id, r.path, r.environment};
    }
    return std::nullopt;
}

std::unique_ptr<env::Environment> RepoEngine::environment_for(const RepoEnvironment& environment) {
    return env::make_environment(environment, executor_, bridge_);
}

Snapshot RepoEngine::snapshot() const {
    Snapshot s;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        s.repos = repos_;
        s.settings = settings_;
    }
    sort_for_display(s.repos);
    s.generated_at = iso_timestamp();
    return s;
}

std::optional<RepoRecord> RepoEngine::find(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& r : repos_) {
        if (r.id == id)
            return r;
    }
    return std::nullopt;
}

void RepoEngine::persist() {
    std::lock_guard<std::mutex> plk(persist_mtx_);
    PersistedState state;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        state.repos = repos_;
        state.settings = settings_;
    }
    if (!store_.save(state) && logger_initialized())
        log_error("Failed to persist state");
}

RepoActionResult RepoEngine::result(bool ok, const std::string& message,
                                    std::optional<Transcript> transcript) const {
    RepoActionResult r;
    r.ok = ok;
    r.message = message;
    r.transcript = std::move(transcript);
    r.snapshot = snapshot();
    return r;
}

RepoActionResult RepoEngine::not_found() const { return result(false, "Repository not found."); }

// ---------------------------------------------------------------------------
// Refresh

void RepoEngine::refresh_direct(const Target& target, env::Environment& environment,
                                const CancelToken& token) {
    bool fetch_enabled;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        fetch_enabled = settings_.fetch_on_refresh;
    }
    std::optional<Transcript> fetch_error;
    if (fetch_enabled) {
        try {
            record_transcript(target.id,
                              environment.run_git(target.path, kRefreshFetchArgs,
                                                  {kRefreshFetchTimeout, &token}));
        } catch (const CommandFailedError& e) {
            fetch_error = e.transcript();
            record_transcript(target.id, e.transcript());
            if (logger_initialized())
                log_warning("Fetch during refresh failed",
                            {{"repo", target.id}, {"exit", exit_code_text(e.transcript())}});
        }
    }

    try {
        Transcript status = environment.run_git(target.path, kStatusArgs,
                                                {kRefreshStatusTimeout, &token});
        record_transcript(target.id, status);
        StatusSummary summary = git::parse_status(status.stdout_text);
        git::OperationMarkers markers =
            environment.probe_operation_state(target.path, {kMarkerProbeTimeout, &token});
        summary.merge_in_progress = markers.merge_in_progress;
        summary.rebase_in_progress = markers.rebase_in_progress;
        git::AttentionInputs inputs;
        inputs.dirty = summary.dirty;
        inputs.ahead = summary.ahead;
        inputs.behind = summary.behind;
        inputs.conflicted = summary.conflicted_count;
        inputs.merge_in_progress = markers.merge_in_progress;
        inputs.rebase_in_progress = markers.rebase_in_progress;
        inputs.fetch_failed = fetch_error.has_value();
        summary.needs_attention = git::needs_attention(inputs);
        summary.refreshed_at = iso_timestamp();
        with_record(target.id, [&](RepoRecord& r) {
            r.status = std::move(summary);
            r.last_error = fetch_error ? kFetchFailed : "";
            r.last_failure = fetch_error;
            r.updated_at = iso_timestamp();
        });
    } catch (const CommandFailedError& e) {
        if (logger_initialized())
            log_warning("Repository inaccessible",
                        {{"repo", target.id}, {"path", target.path},
                         {"exit", exit_code_text(e.transcript())}});
        with_record(target.id, [&](RepoRecord& r) {
            push_history(r, e.transcript());
            r.status = inaccessible_summary();
            r.last_error = kInaccessible;
            r.last_failure = e.transcript();
            r.updated_at = iso_timestamp();
        });
    }
}

bool RepoEngine::prune_missing() {
    std::vector<Target> targets;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto& r : repos_)
            targets.push_back(Target{r.id, r.path, r.environment});
    }
    std::vector<std::string> missing;
    for (const auto& t : targets) {
        auto environment = environment_for(t.environment);
        if (environment->path_exists(t.path) == env::PathState::Missing)
            missing.push_back(t.id);
    }
    if (missing.empty())
        return false;
    for (const auto& id : missing) {
        queue_.cancel_repository(id);
        if (logger_initialized())
            log_info("Pruning vanished repository", {{"repo", id}});
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        repos_.erase(std::remove_if(repos_.begin(), repos_.end(),
                                    [&](const RepoRecord& r) {
                                        return std::find(missing.begin(), missing.end(), r.id) !=
                                               missing.end();
                                    }),
                     repos_.end());
    }
    persist();
    return true;
}

void RepoEngine::refresh_all_pass() {
    prune_missing();
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (const auto& r : repos_)
            ids.push_back(r.id);
    }
    for (const auto& id : ids) {
        auto target = target_of(id);
        if (!target)
            continue;
        try {
            queue_
                .enqueue(
                    id, "Refresh",
                    [this, t = *target](const CancelToken& token) {
                        auto environment = environment_for(t.environment);
                        refresh_direct(t, *environment, token);
                        persist();
                    },
                    kRefreshQueueTimeout)
                .get();
        } catch (const std::exception& e) {
            // The repository record already carries what went wrong.
            if (logger_initialized())
                log_debug("Refresh did not complete", {{"repo", id}, {"error", e.what()}});
        }
    }
}

Snapshot RepoEngine::refresh_all() {
    std::promise<void> mine;
    std::shared_future<void> pending;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lk(refresh_mtx_);
        if (refresh_inflight_.valid()) {
            pending = refresh_inflight_;
        } else {
            refresh_inflight_ = mine.get_future().share();
            owner = true;
        }
    }
    if (!owner) {
        pending.wait();
        return snapshot();
    }
    if (logger_initialized())
        log_info("Refreshing all repositories");
    try {
        refresh_all_pass();
    } catch (const std::exception& e) {
        if (logger_initialized())
            log_error("Refresh pass aborted", {{"error", e.what()}});
    }
    {
        std::lock_guard<std::mutex> lk(refresh_mtx_);
        refresh_inflight_ = std::shared_future<void>();
    }
    mine.set_value();
    return snapshot();
}

RepoActionResult RepoEngine::refresh_repository(const std::string& id) {
    auto target = target_of(id);
    if (!target)
        return not_found();
    try {
        queue_
            .enqueue(
                id, "Refresh",
                [this, t = *target](const CancelToken& token) {
                    auto environment = environment_for(t.environment);
                    refresh_direct(t, *environment, token);
                    persist();
                },
                kRefreshQueueTimeout)
            .get();
    } catch (...) {
        return handle_action_failure(id, "Refresh", std::current_exception());
    }
    auto record = find(id);
    if (record && record->status && record->status->inaccessible)
        return result(false, record->last_error, record->last_failure);
    return result(true, "Refresh completed.");
}

// ---------------------------------------------------------------------------
// Catalog

void RepoEngine::register_repository(const RepoEnvironment& environment, const std::string& path,
                                     const std::string& name, bool* existed) {
    const std::string key = repository_key(environment, path);
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& r : repos_) {
        if (repository_key(r.environment, r.path) == key) {
            if (existed)
                *existed = true;
            return;
        }
    }
    RepoRecord record;
    record.id = new_id("repo");
    record.path = normalize_repo_path(environment, path);
    record.name = name.empty() ? default_display_name(record.path) : name;
    record.environment = environment;
    record.created_at = iso_timestamp();
    record.updated_at = record.created_at;
    if (logger_initialized())
        log_info("Repository registered", {{"repo", record.id}, {"key", key}});
    repos_.push_back(std::move(record));
    if (existed)
        *existed = false;
}

RepoActionResult RepoEngine::add_repository(const AddRepoInput& input) {
    const std::string path = trim(input.path);
    if (path.empty())
        return result(false, "Repository path is required.");
    RepoEnvironment environment = RepoEnvironment::native();
    if (input.guest) {
        const std::string guest = trim(*input.guest);
        if (guest.empty())
            return result(false, "Guest identifier is required.");
        environment = RepoEnvironment::guest_of(guest);
    }
    const std::string location = normalize_repo_path(environment, path);

    Transcript verify;
    try {
        auto env_impl = environment_for(environment);
        verify = env_impl->run_git(location, {"rev-parse", "--is-inside-work-tree"},
                                   {kVerifyTimeout, nullptr});
    } catch (const CommandFailedError& e) {
        if (logger_initialized())
            log_warning("Not a git working tree", {{"path", location}});
        return result(false, "Add repository failed. Exit code " +
                                 exit_code_text(e.transcript()) + ".",
                      e.transcript());
    } catch (const std::exception& e) {
        return result(false, e.what());
    }
    if (trim(verify.stdout_text) != "true")
        return result(false, "Path is not inside a working tree.", verify);

    bool existed = false;
    register_repository(environment, location, input.name ? trim(*input.name) : "", &existed);
    persist();
    return result(true, existed ? "Repository already registered." : "Repository added.",
                  verify);
}

RepoActionResult RepoEngine::remove_repository(const std::string& id) {
    if (!target_of(id))
        return not_found();
    queue_.cancel_repository(id);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        repos_.erase(std::remove_if(repos_.begin(), repos_.end(),
                                    [&](const RepoRecord& r) { return r.id == id; }),
                     repos_.end());
    }
    persist();
    if (logger_initialized())
        log_info("Repository removed", {{"repo", id}});
    return result(true, "Repository removed.");
}

Snapshot RepoEngine::update_settings(const SettingsUpdate& update) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (update.native_roots)
            settings_.native_roots = *update.native_roots;
        if (update.guest_roots) {
            settings_.guest_roots = *update.guest_roots;
            for (auto& root : settings_.guest_roots) {
                if (root.id.empty())
                    root.id = new_id("root");
            }
        }
        if (update.ignore_patterns)
            settings_.ignore_patterns = *update.ignore_patterns;
        if (update.ignored_repos)
            settings_.ignored_repos = *update.ignored_repos;
        if (update.native_editor)
            settings_.native_editor = *update.native_editor;
        if (update.guest_editor)
            settings_.guest_editor = *update.guest_editor;
        if (update.refresh_interval_seconds)
            settings_.refresh_interval_seconds = *update.refresh_interval_seconds;
        if (update.fetch_on_refresh)
            settings_.fetch_on_refresh = *update.fetch_on_refresh;
    }
    persist();
    restart_auto_refresh_if_running();
    return snapshot();
}

Snapshot RepoEngine::scan_configured_roots() {
    prune_missing();
    Settings settings;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        settings = settings_;
    }
    struct Found {
        RepoEnvironment environment;
        std::string path;
    };
    std::vector<Found> discovered;
    env::NativeEnvironment native(executor_);
    for (const auto& root : settings.native_roots) {
        const std::string r = trim(root);
        if (r.empty())
            continue;
        for (auto& p : native.find_repositories(r, settings.ignore_patterns))
            discovered.push_back({RepoEnvironment::native(), std::move(p)});
    }
    for (const auto& root : settings.guest_roots) {
        const std::string r = trim(root.path);
        if (r.empty() || trim(root.guest).empty())
            continue;
        env::GuestEnvironment guest(executor_, bridge_, root.guest);
        try {
            for (auto& p : guest.find_repositories(r, settings.ignore_patterns))
                discovered.push_back({guest.descriptor(), std::move(p)});
        } catch (const ValidationError& e) {
            if (logger_initialized())
                log_warning("Guest root skipped", {{"guest", root.guest}, {"error", e.what()}});
        }
    }
    size_t added = 0;
    for (const auto& f : discovered) {
        const std::string key = repository_key(f.environment, f.path);
        if (std::find(settings.ignored_repos.begin(), settings.ignored_repos.end(), key) !=
            settings.ignored_repos.end())
            continue;
        bool existed = true;
        register_repository(f.environment, f.path, "", &existed);
        if (!existed)
            ++added;
    }
    if (logger_initialized())
        log_info("Scan finished", {{"discovered", std::to_string(discovered.size())},
                                   {"added", std::to_string(added)}});
    persist();
    return refresh_all();
}

// ---------------------------------------------------------------------------
// Actions

RepoActionResult RepoEngine::fail_with_transcript(const std::string& id, const std::string& action,
                                                  const Transcript& t) {
    const std::string message = action + " failed. Exit code " + exit_code_text(t) + ".";
    with_record(id, [&](RepoRecord& r) {
        r.last_error = message;
        r.last_failure = t;
        push_history(r, t);
        r.updated_at = iso_timestamp();
    });
    persist();
    if (logger_initialized())
        log_warning("Action failed", {{"repo", id}, {"action", action}, {"command", t.command},
                                      {"exit", exit_code_text(t)}});
    return result(false, message, t);
}

RepoActionResult RepoEngine::fail_with_message(const std::string& id, const std::string& message) {
    with_record(id, [&](RepoRecord& r) {
        r.last_error = message;
        r.updated_at = iso_timestamp();
    });
    persist();
    if (logger_initialized())
        log_warning("Action rejected", {{"repo", id}, {"reason", message}});
    return result(false, message);
}

RepoActionResult RepoEngine::handle_action_failure(const std::string& id,
                                                   const std::string& action,
                                                   std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const CommandFailedError& e) {
        return fail_with_transcript(id, action, e.transcript());
    } catch (const CancelledError& e) {
        if (e.transcript())
            return fail_with_transcript(id, action, *e.transcript());
        return fail_with_message(id, e.what());
    } catch (const std::exception& e) {
        return fail_with_message(id, e.what());
    }
}

RepoActionResult RepoEngine::run_git_action(const std::string& id, const std::string& action,
                                            const std::vector<std::string>& args,
                                            std::chrono::milliseconds timeout) {
    auto target = target_of(id);
    if (!target)
        return not_found();
    if (logger_initialized())
        log_info("Running action", {{"repo", id}, {"action", action}});
    std::optional<Transcript> transcript;
    try {
        queue_
            .enqueue(
                id, action,
                [&, t = *target](const CancelToken& token) {
                    auto environment = environment_for(t.environment);
                    transcript = environment->run_git(t.path, args, {timeout, &token});
                    record_transcript(t.id, *transcript);
                    refresh_direct(t, *environment, token);
                    with_record(t.id, [](RepoRecord& r) {
                        r.last_error.clear();
                        r.last_failure.reset();
                        r.updated_at = iso_timestamp();
                    });
                    persist();
                },
                timeout + kActionQueueSlack)
            .get();
    } catch (...) {
        return handle_action_failure(id, action, std::current_exception());
    }
    return result(true, action + " completed.", transcript);
}

RepoActionResult RepoEngine::stage_file(const std::string& id, const std::string& path) {
    return run_git_action(id, "Stage " + path, {"add", "--", path}, kActionTimeout);
}

RepoActionResult RepoEngine::unstage_file(const std::string& id, const std::string& path) {
    return run_git_action(id, "Unstage " + path, {"restore", "--staged", "--", path},
                          kActionTimeout);
}

RepoActionResult RepoEngine::push_repository(const std::string& id) {
    return run_git_action(id, "Push", {"push", "--porcelain"}, kPushTimeout);
}

RepoActionResult RepoEngine::commit_repository(const std::string& id, const std::string& message) {
    const std::string text = trim(message);
    if (text.empty())
        return result(false, "Commit message is required.");
    auto target = target_of(id);
    if (!target)
        return not_found();
    if (logger_initialized())
        log_info("Running action", {{"repo", id}, {"action", "Commit"}});
    std::optional<Transcript> transcript;
    try {
        queue_
            .enqueue(
                id, "Commit",
                [&, t = *target](const CancelToken& token) {
                    auto environment = environment_for(t.environment);
                    transcript =
                        environment->run_git(t.path, kStatusArgs, {kCommitStatusTimeout, &token});
                    StatusSummary parsed = git::parse_status(transcript->stdout_text);
                    if (!parsed.dirty)
                        throw ValidationError("No changes to commit.");
                    // Ignore patterns only govern discovery; add -A stages everything.
                    if (!parsed.has_staged) {
                        transcript = environment->run_git(t.path, {"add", "-A"},
                                                          {kStageAllTimeout, &token});
                        record_transcript(t.id, *transcript);
                    }
                    transcript = environment->run_git(t.path, {"commit", "-m", text},
                                                      {kCommitTimeout, &token});
                    record_transcript(t.id, *transcript);
                    refresh_direct(t, *environment, token);
                    with_record(t.id, [](RepoRecord& r) {
                        r.last_error.clear();
                        r.last_failure.reset();
                        r.updated_at = iso_timestamp();
                    });
                    persist();
                },
                kCommitQueueTimeout)
            .get();
    } catch (...) {
        return handle_action_failure(id, "Commit", std::current_exception());
    }
    return result(true, "Commit completed.", transcript);
}

RepoActionResult RepoEngine::sync_repository(const std::string& id) {
    struct Step {
        std::vector<std::string> args;
        std::chrono::milliseconds timeout;
    };
    static const std::vector<Step> kSteps{{{"fetch", "--all", "--prune"}, 60s},
                                          {{"pull"}, 90s},
                                          {{"push", "--porcelain"}, 90s}};
    auto target = target_of(id);
    if (!target)
        return not_found();
    if (logger_initialized())
        log_info("Running action", {{"repo", id}, {"action", "Sync"}});
    std::optional<Transcript> transcript;
    try {
        queue_
            .enqueue(
                id, "Sync",
                [&, t = *target](const CancelToken& token) {
                    auto environment = environment_for(t.environment);
                    for (const auto& step : kSteps) {
                        transcript = environment->run_git(t.path, step.args,
                                                          {step.timeout, &token});
                        record_transcript(t.id, *transcript);
                    }
                    refresh_direct(t, *environment, token);
                    with_record(t.id, [](RepoRecord& r) {
                        r.last_error.clear();
                        r.last_failure.reset();
                        r.updated_at = iso_timestamp();
                    });
                    persist();
                },
                kSyncQueueTimeout)
            .get();
    } catch (...) {
        return handle_action_failure(id, "Sync", std::current_exception());
    }
    return result(true, "Sync completed.", transcript);
}

RepoActionResult RepoEngine::open_in_editor(const std::string& id) {
    auto record = find(id);
    if (!record)
        return not_found();
    std::string editor;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        editor = record->environment.is_guest() ? settings_.guest_editor : settings_.native_editor;
    }
    editor = trim(editor);
    if (editor.empty())
        return result(false, "Failed to open editor: no editor command configured.");
    std::string error;
    if (!launcher_.open_editor(*record, editor, &error))
        return result(false, "Failed to open editor: " + error);
    return result(true, "Editor command launched.");
}

RepoActionResult RepoEngine::open_in_file_manager(const std::string& id) {
    auto record = find(id);
    if (!record)
        return not_found();
    std::string error;
    if (!launcher_.open_file_manager(*record, &error))
        return result(false, "Failed to open file manager: " + error);
    return result(true, "File manager opened.");
}

RepoActionResult RepoEngine::open_in_terminal(const std::string& id) {
    auto record = find(id);
    if (!record)
        return not_found();
    std::string error;
    if (!launcher_.open_terminal(*record, &error))
        return result(false, "Failed to open terminal: " + error);
    return result(true, "Terminal opened.");
}

Snapshot RepoEngine::cancel_repository_operation(const std::string& id) {
    queue_.cancel_repository(id);
    return snapshot();
}

// ---------------------------------------------------------------------------
// Auto refresh

void RepoEngine::auto_refresh_loop(std::chrono::seconds every) {
    std::unique_lock<std::mutex> lk(timer_mtx_);
    while (!timer_stop_) {
        if (timer_cv_.wait_for(lk, every, [this] { return timer_stop_; }))
            break;
        lk.unlock();
        refresh_all();
        lk.lock();
    }
}

void RepoEngine::start_auto_refresh() {
    std::lock_guard<std::mutex> lifecycle(timer_lifecycle_mtx_);
    stop_timer();
    start_timer();
}

void RepoEngine::stop_auto_refresh() {
    std::lock_guard<std::mutex> lifecycle(timer_lifecycle_mtx_);
    stop_timer();
}

void RepoEngine::restart_auto_refresh_if_running() {
    std::lock_guard<std::mutex> lifecycle(timer_lifecycle_mtx_);
    if (!auto_refresh_running())
        return;
    stop_timer();
    start_timer();
}

// Callers hold timer_lifecycle_mtx_.
void RepoEngine::start_timer() {
    int interval;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        interval = effective_refresh_interval(settings_);
    }
    {
        std::lock_guard<std::mutex> lk(timer_mtx_);
        timer_stop_ = false;
        timer_ =
            std::thread([this, interval] { auto_refresh_loop(std::chrono::seconds(interval)); });
    }
    if (logger_initialized())
        log_info("Auto refresh started", {{"interval", format_duration_short(
                                                           std::chrono::seconds(interval))}});
}

void RepoEngine::stop_timer() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lk(timer_mtx_);
        timer_stop_ = true;
        worker = std::move(timer_);
    }
    timer_cv_.notify_all();
    if (worker.joinable())
        worker.join();
}

bool RepoEngine::auto_refresh_running() const {
    std::lock_guard<std::mutex> lk(timer_mtx_);
    return timer_.joinable() && !timer_stop_;
}
