#include "process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <optional>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "errors.hpp"
#include "logger.hpp"
#include "system_utils.hpp"
#include "time_utils.hpp"

extern char** environ;

namespace procutil {

namespace {

enum ChildStage : int { STAGE_CHDIR = 1, STAGE_EXEC = 2, STAGE_FORK = 3 };

// Written by the child to the status pipe when it cannot reach exec.
struct ChildFailure {
    int stage;
    int err;
};

void report_child_failure(int fd, int stage, int err) {
    ChildFailure f{stage, err};
    ssize_t ignored = write(fd, &f, sizeof(f));
    (void)ignored;
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (overrides.count(key))
            continue;
        out.push_back(std::move(entry));
    }
    for (const auto& [k, v] : overrides)
        out.push_back(k + "=" + v);
    return out;
}

std::vector<char*> to_argv(const std::string& program, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

std::optional<ChildFailure> read_child_failure(int fd) {
    ChildFailure f{};
    ssize_t n;
    do {
        n = read(fd, &f, sizeof(f));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(f)))
        return f;
    return std::nullopt;
}

std::string describe_failure(const ChildFailure& f, const std::string& program,
                             const std::filesystem::path& cwd) {
    if (f.stage == STAGE_CHDIR)
        return "cannot enter " + cwd.string() + ": " + std::strerror(f.err);
    if (f.stage == STAGE_FORK)
        return "cannot fork: " + std::string(std::strerror(f.err));
    return "cannot run " + program + ": " + std::strerror(f.err);
}

[[noreturn]] void throw_spawn_error(Transcript& t, const std::string& reason) {
    t.stderr_text = reason;
    t.finished_at = iso_timestamp();
    if (logger_initialized())
        log_error("Spawn failed", {{"command", t.command}, {"reason", reason}});
    throw SpawnError(reason, t);
}

int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

std::string format_invocation(const std::string& program, const std::vector<std::string>& args) {
    std::string out = program;
    for (const auto& a : args) {
        out += ' ';
        out += a;
    }
    return out;
}

Transcript ProcessExecutor::execute(const std::string& program,
                                    const std::vector<std::string>& args,
                                    const RunOptions& opts) {
    Transcript t;
    t.command = format_invocation(program, args);
    t.started_at = iso_timestamp();

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe status_pipe;
    if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(status_pipe))
        throw_spawn_error(t, std::string("cannot create pipe: ") + std::strerror(errno));

    // Everything the child touches is prepared before fork.
    std::vector<std::string> env_strings = build_environment(opts.env);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& s : env_strings)
        envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);
    std::vector<char*> argv = to_argv(program, args);
    const std::string cwd = opts.working_directory.string();

    pid_t pid = fork();
    if (pid < 0)
        throw_spawn_error(t, std::string("cannot fork: ") + std::strerror(errno));
    if (pid == 0) {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0)
            dup2(devnull, STDIN_FILENO);
        dup2(out_pipe.write_end.get(), STDOUT_FILENO);
        dup2(err_pipe.write_end.get(), STDERR_FILENO);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            report_child_failure(status_pipe.write_end.get(), STAGE_CHDIR, errno);
            _exit(127);
        }
        execvpe(program.c_str(), argv.data(), envp.data());
        report_child_failure(status_pipe.write_end.get(), STAGE_EXEC, errno);
        _exit(127);
    }
    setpgid(pid, pid);
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    status_pipe.write_end.reset();

    if (auto failure = read_child_failure(status_pipe.read_end.get())) {
        int ignored = 0;
        waitpid(pid, &ignored, 0);
        throw_spawn_error(t, describe_failure(*failure, program, opts.working_directory));
    }

    set_nonblocking(out_pipe.read_end.get());
    set_nonblocking(err_pipe.read_end.get());

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + opts.timeout;
    clock::time_point kill_at{};
    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    bool term_sent = false;
    bool kill_sent = false;
    int status = 0;

    while (!exited || out_open || err_open) {
        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open)
            fds[nfds++] = pollfd{out_pipe.read_end.get(), POLLIN, 0};
        if (err_open)
            fds[nfds++] = pollfd{err_pipe.read_end.get(), POLLIN, 0};
        if (nfds > 0)
            poll(fds, nfds, 50);
        else
            std::this_thread::sleep_for(std::chrono::milliseconds(10));

        if (out_open)
            out_open = drain_fd(out_pipe.read_end.get(), t.stdout_text);
        if (err_open)
            err_open = drain_fd(err_pipe.read_end.get(), t.stderr_text);
        if (!exited) {
            pid_t r = waitpid(pid, &status, WNOHANG);
            if (r == pid)
                exited = true;
        }

        const auto now = clock::now();
        const bool cancelled = opts.cancel && opts.cancel->cancelled();
        if (!term_sent && (now >= deadline || cancelled)) {
            t.timed_out = true;
            kill(-pid, SIGTERM);
            term_sent = true;
            kill_at = now + kKillGrace;
        } else if (term_sent && !kill_sent && now >= kill_at) {
            kill(-pid, SIGKILL);
            kill_sent = true;
        }
        // Stragglers in the group may keep the pipes open after SIGKILL.
        if (exited && kill_sent)
            break;
    }

    t.exit_code = decode_status(status);
    t.finished_at = iso_timestamp();
    if (logger_initialized())
        log_debug("Command finished", {{"command", t.command},
                                       {"exit", std::to_string(*t.exit_code)},
                                       {"timed_out", t.timed_out ? "true" : "false"}});
    return t;
}

bool ProcessExecutor::launch_detached(const std::string& program,
                                      const std::vector<std::string>& args,
                                      const std::filesystem::path& cwd, std::string* error) {
    Pipe status_pipe;
    if (!make_pipe(status_pipe)) {
        if (error)
            *error = std::string("cannot create pipe: ") + std::strerror(errno);
        return false;
    }
    std::vector<char*> argv = to_argv(program, args);
    const std::string dir = cwd.string();

    pid_t pid = fork();
    if (pid < 0) {
        if (error)
            *error = std::string("cannot fork: ") + std::strerror(errno);
        return false;
    }
    if (pid == 0) {
        setsid();
        // Double fork so the launched program is reparented and never
        // becomes our zombie.
        pid_t grandchild = fork();
        if (grandchild < 0) {
            report_child_failure(status_pipe.write_end.get(), STAGE_FORK, errno);
            _exit(127);
        }
        if (grandchild > 0)
            _exit(0);
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        if (!dir.empty() && chdir(dir.c_str()) != 0) {
            report_child_failure(status_pipe.write_end.get(), STAGE_CHDIR, errno);
            _exit(127);
        }
        execvp(program.c_str(), argv.data());
        report_child_failure(status_pipe.write_end.get(), STAGE_EXEC, errno);
        _exit(127);
    }
    status_pipe.write_end.reset();
    int ignored = 0;
    waitpid(pid, &ignored, 0);
    if (auto failure = read_child_failure(status_pipe.read_end.get())) {
        if (error)
            *error = describe_failure(*failure, program, cwd);
        if (logger_initialized())
            log_warning("Detached launch failed", {{"program", program}});
        return false;
    }
    if (logger_initialized())
        log_debug("Launched detached", {{"command", format_invocation(program, args)}});
    return true;
}

} // namespace procutil
