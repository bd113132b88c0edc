// options/config.cpp
//
// Load configuration from YAML/JSON and auto-discovery.

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

namespace {

void load_file(const fs::path& cfg, std::map<std::string, std::string>& cfg_opts) {
    std::string err;
    bool ok = cfg.extension() == ".json" ? load_json_config(cfg.string(), cfg_opts, err)
                                         : load_yaml_config(cfg.string(), cfg_opts, err);
    if (!ok)
        throw std::runtime_error("Failed to load config " + cfg.string() + ": " + err);
}

fs::path find_cfg(const fs::path& dir) {
    if (dir.empty())
        return {};
    std::error_code ec;
    fs::path y = dir / ".kachina.yaml";
    if (fs::exists(y, ec))
        return y;
    fs::path j = dir / ".kachina.json";
    if (fs::exists(j, ec))
        return j;
    return {};
}

} // namespace

void load_config_and_auto(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                          fs::path& config_file) {
    const std::set<std::string> pre_known{"--config-yaml", "--config-json", "--no-auto-config"};
    const std::set<std::string> pre_values{"--config-yaml", "--config-json"};
    const std::map<char, std::string> pre_short{{'y', "--config-yaml"}, {'j', "--config-json"}};
    ArgParser pre_parser(argc, argv, pre_known, pre_values, pre_short);
    if (pre_parser.has_flag("--config-yaml")) {
        std::string cfg = pre_parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
        return;
    }
    if (pre_parser.has_flag("--config-json")) {
        std::string cfg = pre_parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
        return;
    }
    if (pre_parser.has_flag("--no-auto-config"))
        return;

    std::error_code ec;
    fs::path cfg_path = find_cfg(fs::current_path(ec));
    if (cfg_path.empty() && argv && argv[0])
        cfg_path = find_cfg(fs::absolute(argv[0], ec).parent_path());
    if (!cfg_path.empty()) {
        load_file(cfg_path, cfg_opts);
        config_file = cfg_path;
    }
}
