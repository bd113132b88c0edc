#include "launcher.hpp"

#include "errors.hpp"
#include "logger.hpp"

namespace launcher {

namespace {

const std::string kPlaceholder = "<path>";

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    std::string::size_type pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::string render_command(const std::string& command_template, const std::string& path) {
    const std::string quoted = env::shell_escape(path);
    if (command_template.find(kPlaceholder) == std::string::npos)
        return command_template + " " + quoted;
    std::string out = command_template;
    replace_all(out, kPlaceholder, quoted);
    return out;
}

std::string host_path_for_guest(const std::string& path_template, const std::string& guest,
                                const std::string& path) {
    std::string mapped = path;
    if (path_template.find('\\') != std::string::npos) {
        for (auto& c : mapped) {
            if (c == '/')
                c = '\\';
        }
    }
    std::string out = path_template;
    replace_all(out, "{guest}", guest);
    replace_all(out, "{path}", mapped);
    return out;
}

bool Launcher::launch_host(const std::string& command_template, const std::string& target,
                           const std::string& cwd, std::string* error) {
    const std::string command = render_command(command_template, target);
    if (logger_initialized())
        log_info("Launching", {{"command", command}});
    return executor_.launch_detached("/bin/sh", {"-c", command}, cwd, error);
}

bool Launcher::open_editor(const RepoRecord& repo, const std::string& editor_template,
                           std::string* error) {
    if (!repo.environment.is_guest())
        return launch_host(editor_template, repo.path, repo.path, error);
    const std::string script =
        "cd " + env::shell_escape(repo.path) + " && " + render_command(editor_template, repo.path);
    try {
        auto argv = env::bridge_argv(config_.bridge, repo.environment.guest, script);
        std::string program = argv.front();
        argv.erase(argv.begin());
        if (logger_initialized())
            log_info("Launching in guest", {{"guest", repo.environment.guest}, {"script", script}});
        return executor_.launch_detached(program, argv, {}, error);
    } catch (const ValidationError& e) {
        if (error)
            *error = e.what();
        return false;
    }
}

bool Launcher::open_file_manager(const RepoRecord& repo, std::string* error) {
    if (!repo.environment.is_guest())
        return launch_host(config_.file_manager_command, repo.path, repo.path, error);
    return launch_host(config_.file_manager_command,
                       host_path_for_guest(config_.guest_path_template, repo.environment.guest,
                                           repo.path),
                       {}, error);
}

bool Launcher::open_terminal(const RepoRecord& repo, std::string* error) {
    if (!repo.environment.is_guest())
        return launch_host(config_.terminal_command, repo.path, repo.path, error);
    return launch_host(config_.terminal_command,
                       host_path_for_guest(config_.guest_path_template, repo.environment.guest,
                                           repo.path),
                       {}, error);
}

} // namespace launcher
