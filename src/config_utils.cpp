#include "config_utils.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace {

bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    if (node.IsSequence()) {
        out.clear();
        for (const auto& item : node) {
            if (!item.IsScalar())
                return false;
            if (!out.empty())
                out += ',';
            out += item.Scalar();
        }
        return true;
    }
    out = node.Scalar();
    return true;
}

bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    if (v.is_array()) {
        out.clear();
        for (const auto& item : v) {
            std::string s;
            if (item.is_array() || item.is_object() || !to_string_value(item, s))
                return false;
            if (!out.empty())
                out += ',';
            out += s;
        }
        return true;
    }
    return false;
}

void collect_yaml(const YAML::Node& map, std::map<std::string, std::string>& opts) {
    for (auto it = map.begin(); it != map.end(); ++it) {
        if (!it->first.IsScalar())
            continue;
        const std::string key = it->first.as<std::string>();
        const YAML::Node& node = it->second;
        if (node.IsMap()) {
            collect_yaml(node, opts);
            continue;
        }
        std::string s;
        if (to_string_value(node, s))
            opts["--" + key] = s;
    }
}

void collect_json(const nlohmann::json& obj, std::map<std::string, std::string>& opts) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (it.value().is_object()) {
            collect_json(it.value(), opts);
            continue;
        }
        std::string s;
        if (to_string_value(it.value(), s))
            opts["--" + it.key()] = s;
    }
}

} // namespace

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        collect_yaml(root, opts);
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    nlohmann::json root = nlohmann::json::parse(ifs, nullptr, false);
    if (root.is_discarded()) {
        error = "Invalid JSON";
        return false;
    }
    if (!root.is_object()) {
        error = "Root JSON value is not an object";
        return false;
    }
    collect_json(root, opts);
    return true;
}
