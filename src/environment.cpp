#include "environment.hpp"

#include <cerrno>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "errors.hpp"
#include "logger.hpp"
#include "scanner.hpp"

namespace fs = std::filesystem;

namespace env {

namespace {

constexpr std::chrono::milliseconds kPathProbeTimeout{10000};
constexpr std::chrono::milliseconds kGuestScanTimeout{90000};

std::string env_assignments() {
    std::string out;
    for (const auto& [k, v] : non_interactive_env()) {
        if (!out.empty())
            out += ' ';
        out += k + "=" + shell_escape(v);
    }
    return out;
}

procutil::RunOptions run_options(const CallOptions& opts) {
    procutil::RunOptions ro;
    ro.timeout = opts.timeout;
    ro.cancel = opts.cancel;
    return ro;
}

std::string trimmed(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

std::string shell_escape(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'')
            out += "'\"'\"'";
        else
            out += c;
    }
    out += "'";
    return out;
}

std::map<std::string, std::string> non_interactive_env() {
    return {{"GIT_TERMINAL_PROMPT", "0"},
            {"GCM_INTERACTIVE", "Never"},
            {"GIT_SSH_COMMAND", "ssh -o BatchMode=yes"}};
}

std::vector<std::string> bridge_argv(const BridgeConfig& bridge, const std::string& guest,
                                     const std::string& script) {
    std::vector<std::string> argv;
    std::istringstream in(bridge.command_template);
    std::string token;
    while (in >> token) {
        std::string::size_type pos;
        while ((pos = token.find("{guest}")) != std::string::npos)
            token.replace(pos, 7, guest);
        argv.push_back(token);
    }
    if (argv.empty())
        throw ValidationError("Guest bridge command is empty.");
    argv.push_back(script);
    return argv;
}

std::string guest_git_script(const std::string& repo_path, const std::vector<std::string>& args) {
    std::string script = "cd " + shell_escape(repo_path) + " && " + env_assignments() + " git";
    for (const auto& a : args)
        script += " " + shell_escape(a);
    return script;
}

Transcript run_checked(procutil::CommandExecutor& executor, const std::string& program,
                       const std::vector<std::string>& args, const procutil::RunOptions& opts) {
    Transcript t = executor.execute(program, args, opts);
    if (t.succeeded())
        return t;
    if (opts.cancel && opts.cancel->cancelled())
        throw CancelledError("Operation cancelled", std::move(t));
    if (t.timed_out)
        throw CommandFailedError("Command timed out", std::move(t));
    throw CommandFailedError("Command failed", std::move(t));
}

// ---------------------------------------------------------------------------
// Native

Transcript NativeEnvironment::run_git(const std::string& repo_path,
                                      const std::vector<std::string>& args,
                                      const CallOptions& opts) {
    procutil::RunOptions ro = run_options(opts);
    ro.working_directory = repo_path;
    ro.env = non_interactive_env();
    return run_checked(executor_, "git", args, ro);
}

Transcript NativeEnvironment::run_script(const std::string& script, const CallOptions& opts) {
    procutil::RunOptions ro = run_options(opts);
    ro.env = non_interactive_env();
    return run_checked(executor_, "/bin/sh", {"-c", script}, ro);
}

PathState NativeEnvironment::path_exists(const std::string& path) {
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (!ec)
        return fs::exists(st) ? PathState::Exists : PathState::Missing;
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
        return PathState::Missing;
    if (logger_initialized())
        log_debug("Path probe undecided", {{"path", path}, {"error", ec.message()}});
    return PathState::Unknown;
}

git::OperationMarkers NativeEnvironment::probe_operation_state(const std::string& repo_path,
                                                               const CallOptions&) {
    std::string error;
    auto markers = git::probe_operation_markers(repo_path, &error);
    if (!markers) {
        if (logger_initialized())
            log_debug("Marker probe failed", {{"path", repo_path}, {"error", error}});
        return {};
    }
    return *markers;
}

std::vector<std::string> NativeEnvironment::find_repositories(
    const std::string& root, const std::vector<std::string>& ignore) {
    std::vector<std::string> out;
    for (const auto& p : find_native_repositories(root, ignore))
        out.push_back(p.string());
    return out;
}

// ---------------------------------------------------------------------------
// Guest

Transcript GuestEnvironment::run_git(const std::string& repo_path,
                                     const std::vector<std::string>& args,
                                     const CallOptions& opts) {
    return run_script(guest_git_script(repo_path, args), opts);
}

Transcript GuestEnvironment::run_script(const std::string& script, const CallOptions& opts) {
    std::vector<std::string> argv = bridge_argv(bridge_, guest_, script);
    std::string program = argv.front();
    argv.erase(argv.begin());
    return run_checked(executor_, program, argv, run_options(opts));
}

PathState GuestEnvironment::path_exists(const std::string& path) {
    CallOptions opts;
    opts.timeout = kPathProbeTimeout;
    try {
        Transcript t = run_script("[ -d " + shell_escape(path) + " ] && printf '1' || printf '0'",
                                  opts);
        const std::string marker = trimmed(t.stdout_text);
        if (marker == "1")
            return PathState::Exists;
        if (marker == "0")
            return PathState::Missing;
    } catch (const CommandFailedError& e) {
        if (logger_initialized())
            log_debug("Guest path probe failed", {{"guest", guest_}, {"path", path},
                                                  {"error", e.what()}});
    } catch (const ValidationError& e) {
        if (logger_initialized())
            log_warning("Guest path probe not run", {{"guest", guest_}, {"error", e.what()}});
    }
    return PathState::Unknown;
}

git::OperationMarkers GuestEnvironment::probe_operation_state(const std::string& repo_path,
                                                              const CallOptions& opts) {
    const std::string script =
        "cd " + shell_escape(repo_path) + " && export " + env_assignments() +
        " && m=$(git rev-parse --git-path MERGE_HEAD)"
        " && rm=$(git rev-parse --git-path rebase-merge)"
        " && ra=$(git rev-parse --git-path rebase-apply)"
        " && { [ -e \"$m\" ] && printf '1' || printf '0';"
        " [ -d \"$rm\" ] && printf '1' || printf '0';"
        " [ -d \"$ra\" ] && printf '1' || printf '0'; }";
    git::OperationMarkers markers;
    try {
        Transcript t = run_script(script, opts);
        const std::string flags = trimmed(t.stdout_text);
        if (flags.size() == 3) {
            markers.merge_in_progress = flags[0] == '1';
            markers.rebase_in_progress = flags[1] == '1' || flags[2] == '1';
        }
    } catch (const CommandFailedError& e) {
        if (logger_initialized())
            log_debug("Guest marker probe failed", {{"guest", guest_}, {"path", repo_path},
                                                    {"error", e.what()}});
    }
    return markers;
}

std::vector<std::string> GuestEnvironment::find_repositories(
    const std::string& root, const std::vector<std::string>& ignore) {
    CallOptions opts;
    opts.timeout = kGuestScanTimeout;
    try {
        Transcript t = run_script(guest_find_script(root), opts);
        return parse_guest_find_output(t.stdout_text, ignore);
    } catch (const CommandFailedError& e) {
        if (logger_initialized())
            log_warning("Guest discovery failed", {{"guest", guest_}, {"root", root},
                                                   {"error", e.what()}});
    }
    return {};
}

std::unique_ptr<Environment> make_environment(const RepoEnvironment& environment,
                                              procutil::CommandExecutor& executor,
                                              const BridgeConfig& bridge) {
    if (environment.is_guest())
        return std::make_unique<GuestEnvironment>(executor, bridge, environment.guest);
    return std::make_unique<NativeEnvironment>(executor);
}

} // namespace env
