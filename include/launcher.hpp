#ifndef LAUNCHER_HPP
#define LAUNCHER_HPP
#include <string>
#include "environment.hpp"
#include "process_runner.hpp"
#include "repo.hpp"

namespace launcher {

/// Host view of a guest path; `{guest}` and `{path}` are substituted.
inline const std::string DEFAULT_GUEST_PATH_TEMPLATE = "\\\\wsl$\\{guest}{path}";

/**
 * @brief Commands used to open repositories in external programs.
 */
struct LauncherConfig {
    std::string file_manager_command = "xdg-open <path>";
    std::string terminal_command = "x-terminal-emulator --working-directory=<path>";
    std::string guest_path_template = DEFAULT_GUEST_PATH_TEMPLATE;
    env::BridgeConfig bridge;
};

/**
 * @brief Substitute @p path into a command template.
 *
 * Every `<path>` is replaced by the single-quoted path; without a
 * placeholder the quoted path is appended after a space.
 */
std::string render_command(const std::string& command_template, const std::string& path);

/**
 * @brief Map a guest path onto the host using @p path_template.
 *
 * When the template uses backslashes, forward slashes in @p path are
 * converted as well.
 */
std::string host_path_for_guest(const std::string& path_template, const std::string& guest,
                                 const std::string& path);

/**
 * @brief Fire-and-forget launcher for editor, file manager and terminal.
 *
 * Native launches run the rendered command through `/bin/sh -c` in a new
 * session. Guest editor launches run `cd PATH && COMMAND` through the
 * bridge; guest file manager and terminal launches use the host mapping of
 * the path.
 */
class Launcher {
  public:
    Launcher(procutil::CommandExecutor& executor, LauncherConfig config)
        : executor_(executor), config_(std::move(config)) {}

    bool open_editor(const RepoRecord& repo, const std::string& editor_template,
                     std::string* error);
    bool open_file_manager(const RepoRecord& repo, std::string* error);
    bool open_terminal(const RepoRecord& repo, std::string* error);

    const LauncherConfig& config() const { return config_; }

  private:
    bool launch_host(const std::string& command_template, const std::string& target,
                     const std::string& cwd, std::string* error);

    procutil::CommandExecutor& executor_;
    LauncherConfig config_;
};

} // namespace launcher

#endif // LAUNCHER_HPP
