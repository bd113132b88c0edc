#include "test_common.hpp"
#include "cli_commands.hpp"
#include "help_text.hpp"
#include <iostream>
#include <sstream>

using kachina::test_support::MemoryStateStore;
using kachina::test_support::ScriptedExecutor;
using kachina::test_support::TempDir;

namespace {

RepoRecord record(const std::string& id, const std::string& name, const std::string& path,
                  RepoEnvironment env = RepoEnvironment::native()) {
    RepoRecord r;
    r.id = id;
    r.name = name;
    r.path = path;
    r.environment = env;
    return r;
}

Options command(const std::string& cmd, std::vector<std::string> args = {}) {
    Options opts;
    opts.command = cmd;
    opts.args = std::move(args);
    return opts;
}

struct Fixture {
    git::GitInitGuard guard;
    TempDir dir{"cli_repo"};
    ScriptedExecutor exec;
    MemoryStateStore store;
    RepoEngine engine{store, exec};
    std::ostringstream out;
    std::ostringstream err;
    std::string id;

    Fixture() {
        exec.respond("rev-parse", 0, "true\n");
        exec.respond("status", 0, "## main...origin/main [ahead 1]\n M app.cpp\n");
        RepoActionResult r = engine.add_repository(AddRepoInput{dir.path.string(), {}, {}});
        id = r.snapshot.repos.at(0).id;
    }

    int run(const Options& opts) {
        out.str("");
        err.str("");
        return cli::run_command(opts, engine, out, err);
    }
};

} // namespace

TEST_CASE("resolve_repository prefers ids over names over paths") {
    Snapshot s;
    s.repos.push_back(record("repo_a", "repo_b", "/work/a"));
    s.repos.push_back(record("repo_b", "web", "/work/b"));
    s.repos.push_back(record("repo_c", "tools", "/home/dev/tools", RepoEnvironment::guest_of("Ubuntu")));

    REQUIRE(cli::resolve_repository(s, "repo_b") == std::optional<std::string>("repo_b"));
    REQUIRE(cli::resolve_repository(s, "web") == std::optional<std::string>("repo_b"));
    REQUIRE(cli::resolve_repository(s, "/work/a/") == std::optional<std::string>("repo_a"));
    REQUIRE(cli::resolve_repository(s, "Ubuntu:/home/dev/tools") ==
            std::optional<std::string>("repo_c"));
    REQUIRE_FALSE(cli::resolve_repository(s, "missing"));
}

TEST_CASE("report_result prints transcripts for failures") {
    RepoActionResult r;
    r.ok = false;
    r.message = "Push failed. Exit code 1.";
    Transcript t;
    t.command = "git push --porcelain";
    t.exit_code = 1;
    t.stderr_text = "rejected";
    r.transcript = t;
    std::ostringstream out;
    REQUIRE(cli::report_result(r, false, out) == 1);
    REQUIRE(out.str().find("[failed] Push failed. Exit code 1.") == 0);
    REQUIRE(out.str().find("$ git push --porcelain") != std::string::npos);
    REQUIRE(out.str().find("--- stderr\nrejected\n") != std::string::npos);

    r.ok = true;
    r.message = "Push completed.";
    std::ostringstream quiet;
    REQUIRE(cli::report_result(r, false, quiet) == 0);
    REQUIRE(quiet.str() == "[ok] Push completed.\n");
    std::ostringstream verbose;
    cli::report_result(r, true, verbose);
    REQUIRE(verbose.str().find("$ git push") != std::string::npos);
}

TEST_CASE("print_snapshot marks repositories needing attention") {
    Snapshot s;
    std::ostringstream empty;
    cli::print_snapshot(s, empty);
    REQUIRE(empty.str() == "No repositories registered.\n");

    RepoRecord r = record("repo_a", "app", "/work/app");
    StatusSummary st;
    st.branch = "main";
    st.has_upstream = true;
    st.ahead = 2;
    st.modified_count = 1;
    st.needs_attention = true;
    r.status = st;
    r.last_error = "Push failed. Exit code 1.";
    r.active_operation = ActiveOperation{"op_1", "Sync", ""};
    s.repos.push_back(r);
    s.repos.push_back(record("repo_b", "docs", "/work/docs"));
    std::ostringstream out;
    cli::print_snapshot(s, out);
    const std::string text = out.str();
    REQUIRE(text.find("! app") == 0);
    REQUIRE(text.find("main +2") != std::string::npos);
    REQUIRE(text.find("1 modified") != std::string::npos);
    REQUIRE(text.find("[Sync]") != std::string::npos);
    REQUIRE(text.find("error: Push failed. Exit code 1.") != std::string::npos);
    REQUIRE(text.find("  docs") != std::string::npos);
    REQUIRE(text.find("not refreshed") != std::string::npos);
}

TEST_CASE("run_command lists and refreshes") {
    Fixture f;
    REQUIRE(f.run(command("list")) == 0);
    REQUIRE(f.out.str().find(f.dir.path.filename().string()) != std::string::npos);

    REQUIRE(f.run(command("refresh", {f.id})) == 0);
    REQUIRE(f.out.str() == "[ok] Refresh completed.\n");

    REQUIRE(f.run(command("refresh")) == 0);
    REQUIRE(f.out.str().find("main +1") != std::string::npos);
}

TEST_CASE("run_command resolves repositories by name") {
    Fixture f;
    REQUIRE(f.run(command("push", {f.dir.path.filename().string()})) == 0);
    REQUIRE(f.out.str() == "[ok] Push completed.\n");
    REQUIRE(f.run(command("push", {"nothing-like-this"})) == 1);
    REQUIRE(f.out.str() == "[failed] Repository not found.\n");
}

TEST_CASE("run_command reports usage errors") {
    Fixture f;
    REQUIRE(f.run(command("push")) == 2);
    REQUIRE(f.err.str() == "Usage: kachina push REPO\n");
    REQUIRE(f.run(command("stage", {f.id})) == 2);
    REQUIRE(f.run(command("add")) == 2);
    REQUIRE(f.run(command("frobnicate")) == 2);
    REQUIRE(f.err.str() == "Unknown command: frobnicate\n");
    REQUIRE(f.run(command("cancel", {"missing"})) == 1);
}

TEST_CASE("run_command commits with the message option") {
    Fixture f;
    Options opts = command("commit", {f.id});
    REQUIRE(f.run(opts) == 1);
    REQUIRE(f.out.str() == "[failed] Commit message is required.\n");

    opts.message = "Update app";
    REQUIRE(f.run(opts) == 0);
    REQUIRE(f.out.str() == "[ok] Commit completed.\n");
}

TEST_CASE("run_command emits JSON results") {
    Fixture f;
    f.exec.respond("push", 1, "", "rejected");
    Options opts = command("push", {f.id});
    opts.json_output = true;
    REQUIRE(f.run(opts) == 1);
    auto j = nlohmann::json::parse(f.out.str());
    REQUIRE(j["ok"] == false);
    REQUIRE(j["message"] == "Push failed. Exit code 1.");
    REQUIRE(j["transcript"]["stderr"] == "rejected");
    REQUIRE(j["snapshot"]["repos"].size() == 1);

    Options list = command("list");
    list.json_output = true;
    REQUIRE(f.run(list) == 0);
    REQUIRE(nlohmann::json::parse(f.out.str())["repos"][0]["id"] == f.id);
}

TEST_CASE("run_command emits JSON for output that is not valid UTF-8") {
    Fixture f;
    f.exec.respond("push", 1, "", "rejet\xe9");
    Options opts = command("push", {f.id});
    opts.json_output = true;
    REQUIRE(f.run(opts) == 1);
    auto j = nlohmann::json::parse(f.out.str());
    REQUIRE(j["transcript"]["stderr"] == "rejet\xef\xbf\xbd");
}

TEST_CASE("run_command shows and updates settings") {
    Fixture f;
    REQUIRE(f.run(command("settings")) == 0);
    REQUIRE(f.out.str().find("fetch on refresh: yes") != std::string::npos);

    Options opts = command("settings");
    opts.settings.refresh_interval_seconds = 10;
    opts.settings.fetch_on_refresh = false;
    REQUIRE(f.run(opts) == 0);
    REQUIRE(f.out.str().find("refresh interval: 10s (effective 30s)") != std::string::npos);
    REQUIRE(f.out.str().find("fetch on refresh: no") != std::string::npos);
    REQUIRE(f.store.saved().settings.refresh_interval_seconds == 10);
}

TEST_CASE("run_command prints the transcript history") {
    Fixture f;
    f.exec.respond("push", 1, "", "rejected");
    f.run(command("push", {f.id}));
    REQUIRE(f.run(command("transcript", {f.id})) == 0);
    const std::string text = f.out.str();
    REQUIRE(text.find("Last failure:\n$ git push --porcelain") == 0);
    REQUIRE(text.find("History (1):") != std::string::npos);
}

TEST_CASE("run_command opens external programs") {
    Fixture f;
    REQUIRE(f.run(command("open-terminal", {f.id})) == 0);
    REQUIRE(f.out.str() == "[ok] Terminal opened.\n");
    REQUIRE(f.exec.launches().size() == 1);
}

TEST_CASE("run_command removes repositories") {
    Fixture f;
    REQUIRE(f.run(command("remove", {f.id})) == 0);
    REQUIRE(f.engine.snapshot().repos.empty());
}

TEST_CASE("run_watch prints until stopped") {
    Fixture f;
    std::atomic<bool> running{false};
    std::ostringstream out;
    REQUIRE(cli::run_watch(f.engine, running, false, out) == 0);
    REQUIRE(out.str().find(f.dir.path.filename().string()) != std::string::npos);
    REQUIRE_FALSE(f.engine.auto_refresh_running());
}

TEST_CASE("print_help lists commands") {
    std::ostringstream captured;
    auto* old = std::cout.rdbuf(captured.rdbuf());
    print_help("kachina");
    std::cout.rdbuf(old);
    const std::string text = captured.str();
    REQUIRE(text.find("kachina") != std::string::npos);
    REQUIRE(text.find("sync") != std::string::npos);
    REQUIRE(text.find("--log-file") != std::string::npos);
}
