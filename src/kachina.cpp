/**
 * @file kachina.cpp
 * @brief CLI entry point for the repository dashboard engine.
 *
 * Parses options, initializes logging and libgit2, builds the engine over
 * the JSON state file and hands the subcommand to the CLI layer.
 */

#include <atomic>
#include <csignal>
#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "process_runner.hpp"
#include "repo_engine.hpp"
#include "state_store.hpp"
#include "version.hpp"

namespace {

std::atomic<bool> g_running{true};

void handle_signal(int) { g_running.store(false); }

void setup_logging(const LoggingOptions& logging) {
    if (logging.log_file.empty())
        return;
    set_json_logging(logging.json_log);
    set_log_compression(logging.compress_logs);
    init_logger(logging.log_file, logging.log_level, logging.max_log_size, logging.max_log_files);
    if (logging.use_syslog)
        init_syslog();
}

} // namespace

/**
 * @brief Application entry point.
 *
 * @return Zero on success, one when an action failed or an unexpected error
 *         occurred, two on usage errors.
 */
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help || (opts.command.empty() && !opts.print_version)) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << KACHINA_VERSION << "\n";
            return 0;
        }
        setup_logging(opts.logging);
        if (logger_initialized())
            log_info("Starting", {{"command", opts.command},
                                  {"state", opts.state_file.string()},
                                  {"config", opts.config_file.string()}});

        JsonStateStore store(opts.state_file);
        procutil::ProcessExecutor executor;
        int rc = 0;
        {
            RepoEngine engine(store, executor, engine_config(opts));
            if (opts.command == "watch") {
                std::signal(SIGINT, handle_signal);
                std::signal(SIGTERM, handle_signal);
                rc = cli::run_watch(engine, g_running, opts.json_output, std::cout);
            } else {
                rc = cli::run_command(opts, engine, std::cout, std::cerr);
            }
        }
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
