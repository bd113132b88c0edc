#include "git_utils.hpp"
#include <system_error>

namespace git {

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    auto st = fs::symlink_status(p / ".git", ec);
    if (ec)
        return false;
    return fs::is_directory(st) || fs::is_regular_file(st);
}

static std::string last_error_message() {
    const git_error* e = git_error_last();
    return e && e->message ? e->message : "unknown libgit2 error";
}

std::optional<fs::path> resolve_git_dir(const fs::path& worktree, std::string* error) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open_ext(&raw_repo, worktree.string().c_str(), 0,
                                nullptr) != 0) {
        if (error)
            *error = last_error_message();
        return std::nullopt;
    }
    repo_ptr repo(raw_repo);
    const char* path = git_repository_path(repo.get());
    if (!path) {
        if (error)
            *error = "repository has no git directory";
        return std::nullopt;
    }
    return fs::path(path);
}

std::optional<OperationMarkers> probe_operation_markers(const fs::path& worktree,
                                                        std::string* error) {
    auto git_dir = resolve_git_dir(worktree, error);
    if (!git_dir)
        return std::nullopt;
    std::error_code ec;
    OperationMarkers m;
    m.merge_in_progress = fs::exists(*git_dir / "MERGE_HEAD", ec);
    m.rebase_in_progress = fs::is_directory(*git_dir / "rebase-merge", ec) ||
                           fs::is_directory(*git_dir / "rebase-apply", ec);
    return m;
}

} // namespace git
