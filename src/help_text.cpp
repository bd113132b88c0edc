#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

struct CommandInfo {
    const char* usage;
    const char* desc;
};

void print_help(const char* prog) {
    static const std::vector<CommandInfo> commands = {
        {"list", "Show the catalog without refreshing"},
        {"refresh [REPO]", "Refresh one repository or all of them"},
        {"scan", "Discover repositories below the configured roots"},
        {"add PATH", "Register a repository (--guest, --name)"},
        {"remove REPO", "Forget a repository"},
        {"stage REPO FILE", "Stage one path"},
        {"unstage REPO FILE", "Unstage one path"},
        {"commit REPO -m MSG", "Commit, staging everything when nothing is staged"},
        {"push REPO", "Push the current branch"},
        {"sync REPO", "Fetch, pull and push"},
        {"open-editor REPO", "Open the repository in the configured editor"},
        {"open-files REPO", "Open the repository in the file manager"},
        {"open-terminal REPO", "Open a terminal in the repository"},
        {"cancel REPO", "Cancel running and queued work"},
        {"settings", "Show or change settings"},
        {"transcript REPO", "Show the last failure and recent commands"},
        {"watch", "Refresh periodically until interrupted"}};

    static const std::vector<OptionInfo> opts = {
        {"--guest", "-g", "<id>", "Guest environment for add", "Commands"},
        {"--name", "-n", "<name>", "Display name for add", "Commands"},
        {"--message", "-m", "<text>", "Commit message", "Commands"},
        {"--transcript", "-t", "", "Print the transcript on success too", "Commands"},
        {"--json", "", "", "Print JSON instead of text", "Commands"},
        {"--native-roots", "", "<a,b>", "Native discovery roots", "Settings"},
        {"--guest-roots", "", "<g:/p,...>", "Guest discovery roots", "Settings"},
        {"--ignore-patterns", "", "<a,b>", "Path tokens skipped while scanning", "Settings"},
        {"--ignored-repos", "", "<keys>", "Repository keys never registered by scan", "Settings"},
        {"--native-editor", "", "<cmd>", "Editor command for native repositories", "Settings"},
        {"--guest-editor", "", "<cmd>", "Editor command run inside the guest", "Settings"},
        {"--refresh-interval", "", "<N[s|m|h]>", "Auto refresh period (minimum 30s)",
         "Settings"},
        {"--fetch-on-refresh", "", "<bool>", "Fetch before reading status", "Settings"},
        {"--state-file", "-s", "<path>", "Catalog and settings file", "Config"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON", "Config"},
        {"--no-auto-config", "", "", "Skip .kachina.yaml/.kachina.json discovery", "Config"},
        {"--guest-bridge", "", "<cmd>", "Bridge into the guest ({guest} substituted)",
         "Config"},
        {"--guest-path-template", "", "<tpl>", "Host view of guest paths", "Config"},
        {"--file-manager-command", "", "<cmd>", "File manager command (<path>)", "Config"},
        {"--terminal-command", "", "<cmd>", "Terminal command (<path>)", "Config"},
        {"--log-file", "-l", "<path>", "Write log to file", "Logging"},
        {"--log-level", "-L", "<level>", "debug, info, warning or error", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log at this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated logs to keep", "Logging"},
        {"--json-log", "", "", "One JSON object per log line", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated logs", "Logging"},
        {"--syslog", "", "", "Mirror the file log to syslog", "Logging"},
        {"--version", "-V", "", "Print version", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        width = std::max(width, flag.size());
    }
    for (const auto& c : commands)
        width = std::max(width, std::strlen(c.usage) + 2);

    std::cout << "kachina - git dashboard for native and guest repositories\n";
    std::cout << "Configuration can be read from YAML or JSON files.\n\n";
    std::cout << "Usage: " << prog << " <command> [args] [options]\n\n";
    std::cout << "Commands:\n";
    for (const auto& c : commands)
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << c.usage << c.desc
                  << "\n";
    std::cout << "\n";
    const std::vector<std::string> order{"Commands", "Settings", "Config", "Logging", "Basics"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat]) {
            std::string flag = "  ";
            if (std::strlen(o->short_flag))
                flag += std::string(o->short_flag) + ", ";
            else
                flag += "    ";
            flag += o->long_flag;
            if (std::strlen(o->arg))
                flag += " " + std::string(o->arg);
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << flag << o->desc
                      << "\n";
        }
        std::cout << "\n";
    }
}
