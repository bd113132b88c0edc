#include "test_common.hpp"
#include "launcher.hpp"

using kachina::test_support::ScriptedExecutor;

namespace {

RepoRecord repo_at(const std::string& path, RepoEnvironment env = RepoEnvironment::native()) {
    RepoRecord r;
    r.id = "repo_1";
    r.name = "app";
    r.path = path;
    r.environment = env;
    return r;
}

} // namespace

TEST_CASE("render_command substitutes or appends the quoted path") {
    REQUIRE(launcher::render_command("code <path>", "/work/my app") == "code '/work/my app'");
    REQUIRE(launcher::render_command("diff <path> <path>", "/a") == "diff '/a' '/a'");
    REQUIRE(launcher::render_command("xdg-open", "/a") == "xdg-open '/a'");
    REQUIRE(launcher::render_command("open <path>", "/it's") == "open '/it'\"'\"'s'");
}

TEST_CASE("host_path_for_guest maps guest paths") {
    REQUIRE(launcher::host_path_for_guest(launcher::DEFAULT_GUEST_PATH_TEMPLATE, "Ubuntu",
                                          "/home/dev/app") == "\\\\wsl$\\Ubuntu\\home\\dev\\app");
    REQUIRE(launcher::host_path_for_guest("/mnt/{guest}{path}", "vm1", "/srv/app") ==
            "/mnt/vm1/srv/app");
}

TEST_CASE("Launcher runs native commands through the shell") {
    ScriptedExecutor exec;
    launcher::LauncherConfig cfg;
    cfg.terminal_command = "kitty --directory <path>";
    launcher::Launcher l(exec, cfg);
    std::string err;

    REQUIRE(l.open_editor(repo_at("/work/app"), "nvim <path>", &err));
    REQUIRE(l.open_file_manager(repo_at("/work/app"), &err));
    REQUIRE(l.open_terminal(repo_at("/work/app"), &err));
    auto launches = exec.launches();
    REQUIRE(launches.size() == 3);
    REQUIRE(launches[0].program == "/bin/sh");
    REQUIRE(launches[0].args == std::vector<std::string>{"-c", "nvim '/work/app'"});
    REQUIRE(launches[0].cwd == fs::path("/work/app"));
    REQUIRE(launches[1].args == std::vector<std::string>{"-c", "xdg-open '/work/app'"});
    REQUIRE(launches[2].args == std::vector<std::string>{"-c", "kitty --directory '/work/app'"});
}

TEST_CASE("Launcher runs guest editors through the bridge") {
    ScriptedExecutor exec;
    launcher::LauncherConfig cfg;
    cfg.bridge.command_template = "ssh {guest} --";
    launcher::Launcher l(exec, cfg);
    std::string err;
    REQUIRE(l.open_editor(repo_at("/home/dev/app", RepoEnvironment::guest_of("devbox")),
                          "code <path>", &err));
    auto launches = exec.launches();
    REQUIRE(launches.size() == 1);
    REQUIRE(launches[0].program == "ssh");
    REQUIRE(launches[0].args == std::vector<std::string>{
                                    "devbox", "--", "cd '/home/dev/app' && code '/home/dev/app'"});
    REQUIRE(launches[0].cwd.empty());
}

TEST_CASE("Launcher maps guest paths for host programs") {
    ScriptedExecutor exec;
    launcher::LauncherConfig cfg;
    cfg.guest_path_template = "/mnt/{guest}{path}";
    launcher::Launcher l(exec, cfg);
    std::string err;
    REQUIRE(l.open_file_manager(repo_at("/srv/app", RepoEnvironment::guest_of("vm1")), &err));
    auto launches = exec.launches();
    REQUIRE(launches.size() == 1);
    REQUIRE(launches[0].args == std::vector<std::string>{"-c", "xdg-open '/mnt/vm1/srv/app'"});
    REQUIRE(launches[0].cwd.empty());
}

TEST_CASE("Launcher reports launch failures") {
    ScriptedExecutor exec;
    exec.fail_launches("cannot run /bin/sh: No such file or directory");
    launcher::Launcher l(exec, launcher::LauncherConfig{});
    std::string err;
    REQUIRE_FALSE(l.open_terminal(repo_at("/work/app"), &err));
    REQUIRE(err == "cannot run /bin/sh: No such file or directory");

    launcher::LauncherConfig blank;
    blank.bridge.command_template = "   ";
    launcher::Launcher broken(exec, blank);
    err.clear();
    REQUIRE_FALSE(broken.open_editor(repo_at("/a", RepoEnvironment::guest_of("g")), "code", &err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("ProcessExecutor launches detached programs") {
    kachina::test_support::TempDir dir("launch_real");
    procutil::ProcessExecutor exec;
    launcher::Launcher l(exec, launcher::LauncherConfig{"touch <path>/opened", "true", "", {}});
    std::string err;
    REQUIRE(l.open_file_manager(repo_at(dir.path.string()), &err));
    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!fs::exists(dir.path / "opened") && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(fs::exists(dir.path / "opened"));
}
