#include <zlib.h>
#include <cstdarg>
#include <cstdio>
#ifdef __linux__
#include <syslog.h>
#endif
#include <future>
#include "test_common.hpp"

using kachina::test_support::TempDir;

#ifdef __linux__
static std::vector<std::string> g_syslog_messages;
extern "C" void openlog(const char*, int, int) {}
extern "C" void syslog(int, const char* fmt, ...) {
    char buf[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    g_syslog_messages.emplace_back(buf);
}
extern "C" void closelog() {}
#endif

namespace {

struct LoggerGuard {
    ~LoggerGuard() {
        shutdown_logger();
        set_json_logging(false);
        set_log_compression(false);
    }
};

std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream ifs(p);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

} // namespace

TEST_CASE("Logger rotates and limits files") {
    TempDir dir("logger_rotate");
    const std::string log = (dir.path / "kachina.log").string();
    LoggerGuard guard;
    init_logger(log, LogLevel::INFO, 100, 2);
    REQUIRE(logger_initialized());
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    flush_logger();
    shutdown_logger();
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log + ".1"));
    REQUIRE(fs::exists(log + ".2"));
    REQUIRE_FALSE(fs::exists(log + ".3"));
}

TEST_CASE("Logger compresses rotated files") {
    TempDir dir("logger_compress");
    const std::string log = (dir.path / "kachina.log").string();
    LoggerGuard guard;
    set_log_compression(true);
    init_logger(log, LogLevel::INFO, 100, 2);
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();

    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log + ".1.gz"));
    REQUIRE(fs::exists(log + ".2.gz"));
    REQUIRE_FALSE(fs::exists(log + ".1"));

    gzFile zf = gzopen((log + ".1.gz").c_str(), "rb");
    REQUIRE(zf != nullptr);
    char buf[32];
    int n = gzread(zf, buf, sizeof(buf));
    gzclose(zf);
    REQUIRE(n > 0);
}

TEST_CASE("Logger switches between JSON and plain") {
    TempDir dir("logger_format");
    const fs::path log = dir.path / "kachina.log";
    LoggerGuard guard;
    init_logger(log.string());
    set_json_logging(true);
    log_info("json entry", {{"repo", "repo_1"}});
    flush_logger();
    set_json_logging(false);
    log_warning("plain entry", {{"exit", "128"}});
    flush_logger();
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0][0] == '{');
    auto j = nlohmann::json::parse(lines[0]);
    REQUIRE(j["repo"] == "repo_1");
    REQUIRE(j["level"] == "INFO");
    REQUIRE(j["msg"] == "json entry");
    REQUIRE(lines[1][0] == '[');
    REQUIRE(lines[1].find("[WARNING] plain entry") != std::string::npos);
    REQUIRE(lines[1].find("exit=128") != std::string::npos);
}

TEST_CASE("Logger drops messages below the minimum level") {
    TempDir dir("logger_level");
    const fs::path log = dir.path / "kachina.log";
    LoggerGuard guard;
    init_logger(log.string(), LogLevel::WARNING);
    log_debug("hidden debug");
    log_info("hidden info");
    log_error("shown error");
    set_log_level(LogLevel::DEBUG);
    log_debug("shown debug");
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].find("shown error") != std::string::npos);
    REQUIRE(lines[1].find("shown debug") != std::string::npos);
}

TEST_CASE("parse_log_level accepts names in any case") {
    LogLevel level = LogLevel::INFO;
    REQUIRE(parse_log_level("DEBUG", level));
    REQUIRE(level == LogLevel::DEBUG);
    REQUIRE(parse_log_level("warn", level));
    REQUIRE(level == LogLevel::WARNING);
    REQUIRE(parse_log_level("Error", level));
    REQUIRE(level == LogLevel::ERR);
    REQUIRE_FALSE(parse_log_level("verbose", level));
    REQUIRE(level == LogLevel::ERR);
}

TEST_CASE("shutdown_logger drains queued messages") {
    TempDir dir("logger_drain");
    const fs::path log = dir.path / "kachina.log";
    init_logger(log.string());
    for (int i = 0; i < 50; ++i)
        log_info("queued " + std::to_string(i));
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 50);
}

TEST_CASE("shutdown_logger exits cleanly with no messages") {
    TempDir dir("logger_noop");
    const fs::path log = dir.path / "kachina.log";
    LoggerGuard guard;
    init_logger(log.string());
    REQUIRE(logger_initialized());
    shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
    REQUIRE(fs::exists(log));
    REQUIRE(fs::file_size(log) == 0);
}

TEST_CASE("init_logger can be called twice") {
    TempDir dir("logger_reinit");
    const fs::path log = dir.path / "kachina.log";
    init_logger(log.string());
    log_info("first entry");
    init_logger(log.string());
    log_info("second entry");
    shutdown_logger();
    REQUIRE(read_lines(log).size() >= 2);
}

TEST_CASE("init_logger preserves queued messages during reinit") {
    TempDir dir("logger_reinit_queue");
    const fs::path log = dir.path / "kachina.log";
    init_logger(log.string());
    std::atomic<bool> run{true};
    std::atomic<int> produced{0};
    std::thread t([&] {
        while (run.load()) {
            log_info("entry " + std::to_string(produced.fetch_add(1)));
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    init_logger(log.string());
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    run.store(false);
    t.join();
    shutdown_logger();
    REQUIRE(read_lines(log).size() >= static_cast<size_t>(produced.load()));
}

TEST_CASE("init_logger keeps the previous file on failed reopen") {
    TempDir dir("logger_fail_reinit");
    const fs::path log = dir.path / "kachina.log";
    fs::create_directories(dir.path / "blocked");
    kachina::test_support::write_file(dir.path / "blocked" / "file", "x");
    init_logger(log.string());
    log_info("before");
    init_logger((dir.path / "blocked" / "file" / "kachina.log").string());
    log_info("after");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() >= 2);
    REQUIRE(lines.back().find("after") != std::string::npos);
}

TEST_CASE("init_logger and shutdown_logger can run concurrently") {
    TempDir dir("logger_race");
    init_logger((dir.path / "one.log").string());
    std::promise<void> go;
    auto ready = go.get_future().share();
    std::thread t1([&] {
        ready.wait();
        init_logger((dir.path / "two.log").string());
    });
    std::thread t2([&] {
        ready.wait();
        shutdown_logger();
    });
    go.set_value();
    t1.join();
    t2.join();
    if (logger_initialized())
        shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
}

#ifdef __linux__
TEST_CASE("init_syslog routes messages") {
    TempDir dir("logger_syslog");
    g_syslog_messages.clear();
    init_logger((dir.path / "kachina.log").string());
    init_syslog(LOG_USER);
    log_info("syslog entry");
    shutdown_logger();
    REQUIRE_FALSE(g_syslog_messages.empty());
    REQUIRE(g_syslog_messages.back().find("syslog entry") != std::string::npos);
}
#endif
