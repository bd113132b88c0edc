#ifndef REPO_HPP
#define REPO_HPP
#include <cstddef>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "transcript.hpp"

/// Number of transcripts kept per repository; older entries are evicted.
constexpr std::size_t HISTORY_LIMIT = 40;

/// Lower bound applied to the automatic refresh interval.
constexpr int MIN_REFRESH_INTERVAL_SECONDS = 30;

/**
 * @brief Where a repository lives and therefore how git must be invoked.
 */
enum class EnvironmentKind {
    Native, ///< Host environment, git runs directly
    Guest   ///< Isolated guest reachable only through the bridge
};

/**
 * @brief Execution environment of a repository, fixed at registration.
 */
struct RepoEnvironment {
    EnvironmentKind kind = EnvironmentKind::Native;
    std::string guest; ///< Guest identifier, empty for native repositories

    static RepoEnvironment native() { return {}; }
    static RepoEnvironment guest_of(std::string id) {
        return RepoEnvironment{EnvironmentKind::Guest, std::move(id)};
    }
    bool is_guest() const { return kind == EnvironmentKind::Guest; }
};

inline bool operator==(const RepoEnvironment& a, const RepoEnvironment& b) {
    return a.kind == b.kind && a.guest == b.guest;
}

/**
 * @brief One entry of the porcelain status listing.
 */
struct ChangedFile {
    std::string path;          ///< Path relative to the repository, post-rename target
    char index_status = ' ';   ///< First porcelain status column
    char worktree_status = ' ';///< Second porcelain status column
    bool untracked = false;
    bool staged = false;
    bool unstaged = false;
    bool conflicted = false;
};

inline bool operator==(const ChangedFile& a, const ChangedFile& b) {
    return a.path == b.path && a.index_status == b.index_status &&
           a.worktree_status == b.worktree_status && a.untracked == b.untracked &&
           a.staged == b.staged && a.unstaged == b.unstaged && a.conflicted == b.conflicted;
}

/**
 * @brief Point-in-time status of a working tree.
 *
 * Always rebuilt from scratch by a refresh, never patched in place.
 */
struct StatusSummary {
    bool needs_attention = false;
    bool dirty = false;
    bool has_staged = false;
    bool has_untracked = false;
    int staged_count = 0;
    int modified_count = 0;
    int untracked_count = 0;
    int conflicted_count = 0;
    std::vector<ChangedFile> changed_files;
    std::string branch = "detached";
    bool detached = false;
    bool has_upstream = false;
    int ahead = 0;
    int behind = 0;
    bool merge_in_progress = false;
    bool rebase_in_progress = false;
    bool inaccessible = false;
    std::string refreshed_at; ///< ISO-8601 UTC
};

/**
 * @brief Queue task currently running for a repository.
 */
struct ActiveOperation {
    std::string id;
    std::string name;
    std::string started_at;
};

/**
 * @brief Catalog entry for one registered repository.
 */
struct RepoRecord {
    std::string id;
    std::string name;            ///< Display name
    std::string path;            ///< Location inside its environment
    RepoEnvironment environment;
    std::string created_at;
    std::string updated_at;
    std::optional<StatusSummary> status;
    std::optional<ActiveOperation> active_operation;
    std::string last_error;      ///< Empty when the last action succeeded
    std::optional<Transcript> last_failure;
    std::deque<Transcript> history; ///< Most recent last, at most HISTORY_LIMIT
};

/**
 * @brief Directory inside a guest that is searched for repositories.
 */
struct GuestRoot {
    std::string id;
    std::string guest;
    std::string path;
};

inline bool operator==(const GuestRoot& a, const GuestRoot& b) {
    return a.id == b.id && a.guest == b.guest && a.path == b.path;
}

/**
 * @brief User configurable engine settings.
 */
struct Settings {
    std::vector<std::string> native_roots;
    std::vector<GuestRoot> guest_roots;
    std::vector<std::string> ignore_patterns{"node_modules", "dist", "build", ".venv", ".idea"};
    std::vector<std::string> ignored_repos; ///< Repository keys never registered by a scan
    std::string native_editor = "code <path>";
    std::string guest_editor = "code <path>";
    int refresh_interval_seconds = 180;
    bool fetch_on_refresh = true;
};

/**
 * @brief Partial settings change; only present fields are applied.
 */
struct SettingsUpdate {
    std::optional<std::vector<std::string>> native_roots;
    std::optional<std::vector<GuestRoot>> guest_roots;
    std::optional<std::vector<std::string>> ignore_patterns;
    std::optional<std::vector<std::string>> ignored_repos;
    std::optional<std::string> native_editor;
    std::optional<std::string> guest_editor;
    std::optional<int> refresh_interval_seconds;
    std::optional<bool> fetch_on_refresh;
};

/**
 * @brief Full catalog view handed to callers after every action.
 */
struct Snapshot {
    std::vector<RepoRecord> repos; ///< Needs-attention first, then by name
    Settings settings;
    std::string generated_at;
};

/**
 * @brief Outcome of a caller-facing engine action.
 */
struct RepoActionResult {
    bool ok = false;
    std::string message;
    std::optional<Transcript> transcript;
    Snapshot snapshot;
};

/**
 * @brief Parameters for registering a repository by hand.
 */
struct AddRepoInput {
    std::string path;
    std::optional<std::string> guest; ///< Register inside this guest when set
    std::optional<std::string> name;  ///< Display name override
};

/**
 * @brief Generate an identifier such as `repo_1a2b3c4d5e6f`.
 */
std::string new_id(const std::string& prefix);

/**
 * @brief Canonical location used for identity.
 *
 * Native paths are made absolute and lexically normalized; guest paths only
 * lose trailing slashes. Neither form keeps a trailing separator.
 */
std::string normalize_repo_path(const RepoEnvironment& env, const std::string& path);

/**
 * @brief Unique catalog key: `native:<path>` or `guest:<id>:<path>`.
 */
std::string repository_key(const RepoEnvironment& env, const std::string& path);

/**
 * @brief Last path component, used when no display name is given.
 */
std::string default_display_name(const std::string& path);

/**
 * @brief Append @p t to the record's history, evicting the oldest entries.
 */
void push_history(RepoRecord& record, Transcript t);

/**
 * @brief Order records for display: needs-attention first, then by name.
 */
void sort_for_display(std::vector<RepoRecord>& repos);

/**
 * @brief Effective automatic refresh period after applying the floor.
 */
int effective_refresh_interval(const Settings& settings);

#endif // REPO_HPP
