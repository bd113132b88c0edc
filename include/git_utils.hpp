#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <string>
#include <filesystem>
#include <optional>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;

/**
 * @brief Flags describing an interrupted multi-step git operation.
 */
struct OperationMarkers {
    bool merge_in_progress = false;  ///< `MERGE_HEAD` exists
    bool rebase_in_progress = false; ///< `rebase-merge` or `rebase-apply` exists
};

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Determine whether the given path is the top of a working tree.
 *
 * @param p Filesystem path to check.
 * @return `true` if @a p contains a `.git` directory or a `.git` file (as
 *         used by linked worktrees and submodules).
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Locate the git directory of the working tree at @p worktree.
 *
 * Resolves `.git` files and linked worktrees through libgit2, so the result
 * is the directory holding `HEAD`, `MERGE_HEAD` and the rebase state.
 *
 * @param worktree Path inside a working tree.
 * @param error    Optional output string receiving a libgit2 error message.
 * @return Git directory or `std::nullopt` when no repository was found.
 */
std::optional<fs::path> resolve_git_dir(const fs::path& worktree, std::string* error = nullptr);

/**
 * @brief Inspect the git directory for merge and rebase markers.
 *
 * @param worktree Path of the working tree.
 * @param error    Optional output string receiving a libgit2 error message.
 * @return Marker flags or `std::nullopt` if the repository cannot be opened.
 */
std::optional<OperationMarkers> probe_operation_markers(const fs::path& worktree,
                                                        std::string* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
