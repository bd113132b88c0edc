#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "cancel_token.hpp"
#include "transcript.hpp"

namespace procutil {

/// Delay between the polite SIGTERM and the forced SIGKILL.
constexpr std::chrono::milliseconds kKillGrace{2000};

/**
 * @brief Parameters for a single process invocation.
 */
struct RunOptions {
    std::filesystem::path working_directory;       ///< Empty to inherit ours
    std::chrono::milliseconds timeout{30000};      ///< Hard limit for the whole run
    const CancelToken* cancel = nullptr;           ///< Optional cooperative stop flag
    std::map<std::string, std::string> env;        ///< Variables added or overridden
};

/**
 * @brief Seam between the engine and the operating system.
 *
 * The production implementation is @ref ProcessExecutor; tests substitute a
 * scripted executor to observe invocations without spawning anything.
 */
class CommandExecutor {
  public:
    virtual ~CommandExecutor() = default;

    /**
     * @brief Run @p program to completion and capture its output.
     *
     * Non-zero exit codes and timeouts are reported through the returned
     * transcript, never by throwing.
     *
     * @throws SpawnError when the program or its working directory cannot be
     *         used at all.
     */
    virtual Transcript execute(const std::string& program, const std::vector<std::string>& args,
                               const RunOptions& opts) = 0;

    /**
     * @brief Start a program in its own session without waiting for it.
     *
     * @param error Receives a description when launching fails.
     * @return `true` once the program image has been executed.
     */
    virtual bool launch_detached(const std::string& program, const std::vector<std::string>& args,
                                 const std::filesystem::path& cwd, std::string* error) = 0;
};

/**
 * @brief fork/exec based executor for POSIX hosts.
 *
 * The child runs in its own process group so a timeout or cancellation can
 * terminate everything it started (bridges, ssh helpers). Output is read
 * through non-blocking pipes polled every 50 ms; the same loop checks the
 * deadline and the cancel token.
 */
class ProcessExecutor : public CommandExecutor {
  public:
    Transcript execute(const std::string& program, const std::vector<std::string>& args,
                       const RunOptions& opts) override;
    bool launch_detached(const std::string& program, const std::vector<std::string>& args,
                         const std::filesystem::path& cwd, std::string* error) override;
};

/**
 * @brief Join a program and its arguments with single spaces.
 */
std::string format_invocation(const std::string& program, const std::vector<std::string>& args);

} // namespace procutil

#endif // PROCESS_RUNNER_HPP
