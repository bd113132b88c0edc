#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "logger.hpp"
#include "repo.hpp"
#include "repo_engine.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file; ///< Empty disables file logging
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
};

/**
 * @brief Everything the driver needs, merged from CLI flags and config file.
 */
struct Options {
    std::string command;           ///< Subcommand; empty prints help
    std::vector<std::string> args; ///< Positionals after the subcommand
    std::filesystem::path config_file;
    std::filesystem::path state_file;
    LoggingOptions logging;

    std::string guest_bridge;
    std::string guest_path_template;
    std::string file_manager_command;
    std::string terminal_command;

    bool json_output = false;
    bool show_transcript = false;
    bool show_help = false;
    bool print_version = false;

    // add
    std::optional<std::string> guest;
    std::optional<std::string> name;
    // commit
    std::optional<std::string> message;
    // settings
    SettingsUpdate settings;
};

/**
 * @brief Read config files named on the command line or auto-discovered.
 *
 * `--config-yaml`/`--config-json` win; otherwise `.kachina.yaml` or
 * `.kachina.json` is looked up in the working directory and then next to
 * the executable.
 */
void load_config_and_auto(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                          std::filesystem::path& config_file);

/**
 * @brief Parse the command line merged over the configuration file.
 *
 * @throws std::runtime_error on unknown flags or invalid values.
 */
Options parse_options(int argc, char* argv[]);

/** @brief `$XDG_STATE_HOME/kachina/state.json`, falling back to `~/.local/state`. */
std::filesystem::path default_state_file();

/** @brief Engine wiring derived from @p opts. */
EngineConfig engine_config(const Options& opts);

#endif // OPTIONS_HPP
