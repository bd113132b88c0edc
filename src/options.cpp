#include <climits>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "ignore_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "version.hpp"

namespace fs = std::filesystem;

namespace {

// Keys accepted from configuration files as well as the command line.
const std::set<std::string> kConfigKeys{"--state-file",
                                        "--log-file",
                                        "--log-level",
                                        "--max-log-size",
                                        "--max-log-files",
                                        "--json-log",
                                        "--compress-logs",
                                        "--syslog",
                                        "--guest-bridge",
                                        "--guest-path-template",
                                        "--file-manager-command",
                                        "--terminal-command",
                                        "--json"};

GuestRoot parse_guest_root(const std::string& text) {
    size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size())
        throw std::runtime_error("Invalid guest root '" + text + "', expected GUEST:/path");
    GuestRoot root;
    root.id = new_id("root");
    root.guest = text.substr(0, colon);
    root.path = text.substr(colon + 1);
    return root;
}

void parse_settings_flags(Options& opts, const ArgParser& parser) {
    bool ok = false;
    if (parser.has_flag("--native-roots"))
        opts.settings.native_roots = ignore::split_list(parser.get_option("--native-roots"));
    if (parser.has_flag("--guest-roots")) {
        std::vector<GuestRoot> roots;
        for (const auto& item : ignore::split_list(parser.get_option("--guest-roots")))
            roots.push_back(parse_guest_root(item));
        opts.settings.guest_roots = roots;
    }
    if (parser.has_flag("--ignore-patterns"))
        opts.settings.ignore_patterns = ignore::split_list(parser.get_option("--ignore-patterns"));
    if (parser.has_flag("--ignored-repos"))
        opts.settings.ignored_repos = ignore::split_list(parser.get_option("--ignored-repos"));
    if (parser.has_flag("--native-editor"))
        opts.settings.native_editor = parser.get_option("--native-editor");
    if (parser.has_flag("--guest-editor"))
        opts.settings.guest_editor = parser.get_option("--guest-editor");
    if (parser.has_flag("--refresh-interval")) {
        auto dur = parse_duration(parser.get_option("--refresh-interval"), ok);
        if (!ok || dur.count() > INT_MAX)
            throw std::runtime_error("Invalid value for --refresh-interval");
        opts.settings.refresh_interval_seconds = static_cast<int>(dur.count());
    }
    if (parser.has_flag("--fetch-on-refresh")) {
        bool v = parse_bool(parser.get_option("--fetch-on-refresh"), ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --fetch-on-refresh");
        opts.settings.fetch_on_refresh = v;
    }
}

} // namespace

fs::path default_state_file() {
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg)
        return fs::path(xdg) / KACHINA_APP_NAME / "state.json";
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home) / ".local" / "state" / KACHINA_APP_NAME / "state.json";
    return fs::path(".kachina") / "state.json";
}

Options parse_options(int argc, char* argv[]) {
    fs::path config_file;
    std::map<std::string, std::string> cfg_opts;
    load_config_and_auto(argc, argv, cfg_opts, config_file);

    std::set<std::string> known = kConfigKeys;
    known.insert({"--help", "--version", "--config-yaml", "--config-json", "--no-auto-config",
                  "--transcript", "--guest", "--name", "--message", "--native-roots",
                  "--guest-roots", "--ignore-patterns", "--ignored-repos", "--native-editor",
                  "--guest-editor", "--refresh-interval", "--fetch-on-refresh"});
    const std::set<std::string> values{"--state-file",
                                       "--log-file",
                                       "--log-level",
                                       "--max-log-size",
                                       "--max-log-files",
                                       "--guest-bridge",
                                       "--guest-path-template",
                                       "--file-manager-command",
                                       "--terminal-command",
                                       "--config-yaml",
                                       "--config-json",
                                       "--guest",
                                       "--name",
                                       "--message",
                                       "--native-roots",
                                       "--guest-roots",
                                       "--ignore-patterns",
                                       "--ignored-repos",
                                       "--native-editor",
                                       "--guest-editor",
                                       "--refresh-interval",
                                       "--fetch-on-refresh"};
    const std::map<char, std::string> short_opts{{'h', "--help"},
                                                 {'V', "--version"},
                                                 {'y', "--config-yaml"},
                                                 {'j', "--config-json"},
                                                 {'s', "--state-file"},
                                                 {'l', "--log-file"},
                                                 {'L', "--log-level"},
                                                 {'g', "--guest"},
                                                 {'n', "--name"},
                                                 {'m', "--message"},
                                                 {'t', "--transcript"}};
    ArgParser parser(argc, argv, known, values, short_opts);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");
    for (const auto& kv : cfg_opts) {
        if (!kConfigKeys.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }

    // CLI value first, config file second.
    auto opt = [&](const std::string& k) -> std::optional<std::string> {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::nullopt;
    };
    auto flag = [&](const std::string& k) {
        auto v = opt(k);
        if (!v)
            return false;
        bool ok = false;
        bool b = parse_bool(*v, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for " + k);
        return b;
    };

    Options opts;
    opts.config_file = config_file;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.show_transcript = parser.has_flag("--transcript");
    opts.json_output = flag("--json");

    if (!parser.positional().empty()) {
        opts.command = parser.positional().front();
        opts.args.assign(parser.positional().begin() + 1, parser.positional().end());
    }

    if (auto v = opt("--state-file"); v && !v->empty())
        opts.state_file = *v;
    else
        opts.state_file = default_state_file();

    bool ok = false;
    if (auto v = opt("--log-file"))
        opts.logging.log_file = *v;
    if (auto v = opt("--log-level")) {
        if (!parse_log_level(*v, opts.logging.log_level))
            throw std::runtime_error("Invalid value for --log-level");
    }
    if (auto v = opt("--max-log-size")) {
        opts.logging.max_log_size = parse_bytes(*v, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (auto v = opt("--max-log-files")) {
        opts.logging.max_log_files = parse_size_t(*v, 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    opts.logging.json_log = flag("--json-log");
    opts.logging.compress_logs = flag("--compress-logs");
    opts.logging.use_syslog = flag("--syslog");

    if (auto v = opt("--guest-bridge"))
        opts.guest_bridge = *v;
    if (auto v = opt("--guest-path-template"))
        opts.guest_path_template = *v;
    if (auto v = opt("--file-manager-command"))
        opts.file_manager_command = *v;
    if (auto v = opt("--terminal-command"))
        opts.terminal_command = *v;

    if (parser.has_flag("--guest"))
        opts.guest = parser.get_option("--guest");
    if (parser.has_flag("--name"))
        opts.name = parser.get_option("--name");
    if (parser.has_flag("--message"))
        opts.message = parser.get_option("--message");
    parse_settings_flags(opts, parser);
    return opts;
}

EngineConfig engine_config(const Options& opts) {
    EngineConfig cfg;
    if (!opts.guest_bridge.empty())
        cfg.bridge.command_template = opts.guest_bridge;
    if (!opts.guest_path_template.empty())
        cfg.launcher.guest_path_template = opts.guest_path_template;
    if (!opts.file_manager_command.empty())
        cfg.launcher.file_manager_command = opts.file_manager_command;
    if (!opts.terminal_command.empty())
        cfg.launcher.terminal_command = opts.terminal_command;
    return cfg;
}
