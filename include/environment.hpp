#ifndef ENVIRONMENT_HPP
#define ENVIRONMENT_HPP
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "cancel_token.hpp"
#include "git_utils.hpp"
#include "process_runner.hpp"
#include "repo.hpp"
#include "transcript.hpp"

namespace env {

/// Default bridge used to reach a guest; the script is appended last.
inline const std::string DEFAULT_BRIDGE = "wsl.exe -d {guest} -- bash -lc";

/**
 * @brief Quote @p value for a POSIX shell.
 *
 * The value is wrapped in single quotes and every embedded `'` becomes
 * `'"'"'`.
 */
std::string shell_escape(const std::string& value);

/**
 * @brief Variables that stop git and its helpers from prompting.
 */
std::map<std::string, std::string> non_interactive_env();

/**
 * @brief How commands are routed into a guest environment.
 */
struct BridgeConfig {
    std::string command_template = DEFAULT_BRIDGE; ///< `{guest}` is substituted
};

/**
 * @brief Expand the bridge template into argv with @p script as last element.
 *
 * The template is split on whitespace; tokens are not shell-parsed.
 *
 * @throws ValidationError when the template is blank.
 */
std::vector<std::string> bridge_argv(const BridgeConfig& bridge, const std::string& guest,
                                     const std::string& script);

/**
 * @brief Guest shell line that enters @p repo_path and runs git with @p args.
 */
std::string guest_git_script(const std::string& repo_path, const std::vector<std::string>& args);

/**
 * @brief Result of a path existence probe.
 */
enum class PathState {
    Exists,
    Missing,
    Unknown ///< The probe itself failed; callers keep the record
};

/**
 * @brief Per-call limits for commands run through an environment.
 */
struct CallOptions {
    std::chrono::milliseconds timeout{30000};
    const CancelToken* cancel = nullptr;
};

/**
 * @brief Capability interface for everything that depends on where a
 * repository lives.
 *
 * Engine code never inspects @ref RepoEnvironment itself; it asks
 * @ref make_environment for the matching implementation.
 */
class Environment {
  public:
    virtual ~Environment() = default;

    /**
     * @brief Run git inside @p repo_path.
     *
     * @throws CommandFailedError on non-zero exit or timeout.
     * @throws SpawnError when the program cannot be started.
     * @throws CancelledError when @p opts.cancel fired during the run.
     */
    virtual Transcript run_git(const std::string& repo_path, const std::vector<std::string>& args,
                               const CallOptions& opts) = 0;

    /**
     * @brief Run a shell script in this environment with the same error
     * contract as @ref run_git.
     */
    virtual Transcript run_script(const std::string& script, const CallOptions& opts) = 0;

    /**
     * @brief Tell whether a directory still exists.
     */
    virtual PathState path_exists(const std::string& path) = 0;

    /**
     * @brief Detect merge or rebase state; failures report no markers.
     */
    virtual git::OperationMarkers probe_operation_state(const std::string& repo_path,
                                                        const CallOptions& opts) = 0;

    /**
     * @brief Discover working trees below @p root.
     *
     * @return Repository paths inside this environment; empty when the root
     *         is missing or cannot be searched.
     */
    virtual std::vector<std::string> find_repositories(const std::string& root,
                                                       const std::vector<std::string>& ignore) = 0;

    /** @return Descriptor of this environment. */
    virtual RepoEnvironment descriptor() const = 0;
};

/**
 * @brief Host environment: git runs directly with the repository as cwd.
 */
class NativeEnvironment : public Environment {
  public:
    explicit NativeEnvironment(procutil::CommandExecutor& executor) : executor_(executor) {}

    Transcript run_git(const std::string& repo_path, const std::vector<std::string>& args,
                       const CallOptions& opts) override;
    Transcript run_script(const std::string& script, const CallOptions& opts) override;
    PathState path_exists(const std::string& path) override;
    git::OperationMarkers probe_operation_state(const std::string& repo_path,
                                                const CallOptions& opts) override;
    std::vector<std::string> find_repositories(const std::string& root,
                                               const std::vector<std::string>& ignore) override;
    RepoEnvironment descriptor() const override { return RepoEnvironment::native(); }

  private:
    procutil::CommandExecutor& executor_;
};

/**
 * @brief Guest environment reached through the configured bridge.
 *
 * Every call becomes one bridge invocation carrying a single shell script.
 */
class GuestEnvironment : public Environment {
  public:
    GuestEnvironment(procutil::CommandExecutor& executor, BridgeConfig bridge, std::string guest)
        : executor_(executor), bridge_(std::move(bridge)), guest_(std::move(guest)) {}

    Transcript run_git(const std::string& repo_path, const std::vector<std::string>& args,
                       const CallOptions& opts) override;
    Transcript run_script(const std::string& script, const CallOptions& opts) override;
    PathState path_exists(const std::string& path) override;
    git::OperationMarkers probe_operation_state(const std::string& repo_path,
                                                const CallOptions& opts) override;
    std::vector<std::string> find_repositories(const std::string& root,
                                               const std::vector<std::string>& ignore) override;
    RepoEnvironment descriptor() const override { return RepoEnvironment::guest_of(guest_); }

  private:
    procutil::CommandExecutor& executor_;
    BridgeConfig bridge_;
    std::string guest_;
};

/**
 * @brief Build the implementation matching @p environment.
 */
std::unique_ptr<Environment> make_environment(const RepoEnvironment& environment,
                                              procutil::CommandExecutor& executor,
                                              const BridgeConfig& bridge);

/**
 * @brief Execute and convert a failed transcript into the matching exception.
 *
 * Shared by both variants so the error contract lives in one place.
 */
Transcript run_checked(procutil::CommandExecutor& executor, const std::string& program,
                       const std::vector<std::string>& args, const procutil::RunOptions& opts);

} // namespace env

#endif // ENVIRONMENT_HPP
