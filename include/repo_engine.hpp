#ifndef REPO_ENGINE_HPP
#define REPO_ENGINE_HPP
#include <chrono>
#include <condition_variable>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "cancel_token.hpp"
#include "environment.hpp"
#include "launcher.hpp"
#include "operation_queue.hpp"
#include "process_runner.hpp"
#include "repo.hpp"
#include "state_store.hpp"

/**
 * @brief Wiring that depends on the host rather than on stored settings.
 */
struct EngineConfig {
    env::BridgeConfig bridge;
    launcher::LauncherConfig launcher; ///< Its bridge is replaced by @ref bridge
};

/**
 * @brief Owns the repository catalog and runs every repository operation.
 *
 * All public methods may be called from any thread and block until their
 * queued work has settled. One mutex guards the catalog and settings; the
 * operation queue serializes work per repository. Task bodies copy what they
 * need under the lock, run commands without it and write results back under
 * it, so a snapshot can be taken while commands are running.
 *
 * Failures never escape as exceptions: every action reports through
 * @ref RepoActionResult.
 */
class RepoEngine {
  public:
    RepoEngine(StateStore& store, procutil::CommandExecutor& executor, EngineConfig config = {});
    ~RepoEngine();

    RepoEngine(const RepoEngine&) = delete;
    RepoEngine& operator=(const RepoEngine&) = delete;

    /** @brief Catalog, settings and generation time. */
    Snapshot snapshot() const;

    /** @brief Copy of one record, if registered. */
    std::optional<RepoRecord> find(const std::string& id) const;

    /**
     * @brief Prune vanished repositories and refresh the rest one by one.
     *
     * Concurrent callers share a single pass.
     */
    Snapshot refresh_all();

    /** @brief Refresh a single repository through its queue. */
    RepoActionResult refresh_repository(const std::string& id);

    /**
     * @brief Discover repositories below every configured root, register
     * new ones and refresh everything.
     */
    Snapshot scan_configured_roots();

    /** @brief Verify and register a repository; repeated adds are no-ops. */
    RepoActionResult add_repository(const AddRepoInput& input);

    /** @brief Forget a repository after cancelling its queued work. */
    RepoActionResult remove_repository(const std::string& id);

    /** @brief Merge present fields into the settings and persist them. */
    Snapshot update_settings(const SettingsUpdate& update);

    RepoActionResult stage_file(const std::string& id, const std::string& path);
    RepoActionResult unstage_file(const std::string& id, const std::string& path);

    /**
     * @brief Commit the working tree.
     *
     * When nothing is staged every change is staged first with `add -A`.
     */
    RepoActionResult commit_repository(const std::string& id, const std::string& message);

    RepoActionResult push_repository(const std::string& id);

    /** @brief fetch, pull and push as one queue task; stops at the first failure. */
    RepoActionResult sync_repository(const std::string& id);

    RepoActionResult open_in_editor(const std::string& id);
    RepoActionResult open_in_file_manager(const std::string& id);
    RepoActionResult open_in_terminal(const std::string& id);

    /** @brief Signal the running task and drop queued ones for @p id. */
    Snapshot cancel_repository_operation(const std::string& id);

    /** @brief Run @ref refresh_all periodically on a background thread. */
    void start_auto_refresh();
    void stop_auto_refresh();
    bool auto_refresh_running() const;

  private:
    // Immutable fields a task body needs, copied under the lock.
    struct Target {
        std::string id;
        std::string path;
        RepoEnvironment environment;
    };

    std::optional<Target> target_of(const std::string& id) const;
    std::unique_ptr<env::Environment> environment_for(const RepoEnvironment& environment);

    template <typename Fn> void with_record(const std::string& id, Fn&& fn);
    void record_transcript(const std::string& id, const Transcript& t);

    void refresh_direct(const Target& target, env::Environment& environment,
                        const CancelToken& token);
    void refresh_all_pass();
    bool prune_missing();
    void register_repository(const RepoEnvironment& environment, const std::string& path,
                             const std::string& name, bool* existed);
    void persist();

    RepoActionResult run_git_action(const std::string& id, const std::string& action,
                                    const std::vector<std::string>& args,
                                    std::chrono::milliseconds timeout);
    RepoActionResult handle_action_failure(const std::string& id, const std::string& action,
                                           std::exception_ptr error);
    RepoActionResult fail_with_transcript(const std::string& id, const std::string& action,
                                          const Transcript& t);
    RepoActionResult fail_with_message(const std::string& id, const std::string& message);
    RepoActionResult result(bool ok, const std::string& message,
                            std::optional<Transcript> transcript = std::nullopt) const;
    RepoActionResult not_found() const;

    void auto_refresh_loop(std::chrono::seconds every);
    void restart_auto_refresh_if_running();
    void start_timer();
    void stop_timer();

    StateStore& store_;
    procutil::CommandExecutor& executor_;
    env::BridgeConfig bridge_;
    launcher::Launcher launcher_;

    mutable std::mutex mtx_;
    std::vector<RepoRecord> repos_;
    Settings settings_;

    std::mutex persist_mtx_;

    std::mutex refresh_mtx_;
    std::shared_future<void> refresh_inflight_;

    std::mutex timer_lifecycle_mtx_; ///< Serializes start, stop and restart
    mutable std::mutex timer_mtx_;
    std::condition_variable timer_cv_;
    bool timer_stop_ = false;
    std::thread timer_;

    OperationQueue queue_; ///< Last member: destroyed first, joining workers
};

#endif // REPO_ENGINE_HPP
