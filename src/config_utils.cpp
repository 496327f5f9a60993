#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    if (node.IsSequence()) {
        std::string joined;
        for (const auto& item : node) {
            if (!item.IsScalar())
                return false;
            if (!joined.empty())
                joined += '\n';
            joined += item.Scalar();
        }
        out = joined;
        return true;
    }
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
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
        std::string joined;
        for (const auto& item : v) {
            std::string s;
            if (item.is_array() || item.is_object() || !to_string_value(item, s))
                return false;
            if (!joined.empty())
                joined += '\n';
            joined += s;
        }
        out = joined;
        return true;
    }
    return false;
}

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
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (node.IsMap()) {
                for (auto it2 = node.begin(); it2 != node.end(); ++it2) {
                    if (!it2->first.IsScalar())
                        continue;
                    std::string key = "--" + it2->first.as<std::string>();
                    std::string s;
                    if (!to_string_value(it2->second, s)) {
                        error = "Unsupported value for " + key;
                        return false;
                    }
                    opts[key] = s;
                }
            } else {
                std::string s;
                if (!to_string_value(node, s)) {
                    error = "Unsupported value for --" + key_name;
                    return false;
                }
                opts["--" + key_name] = s;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            const std::string key_name = it.key();
            if (val.is_object()) {
                for (auto sub = val.begin(); sub != val.end(); ++sub) {
                    std::string key = "--" + sub.key();
                    std::string s;
                    if (!to_string_value(sub.value(), s)) {
                        error = "Unsupported value for " + key;
                        return false;
                    }
                    opts[key] = s;
                }
            } else {
                std::string key = "--" + key_name;
                std::string s;
                if (!to_string_value(val, s)) {
                    error = "Unsupported value for " + key;
                    return false;
                }
                opts[key] = s;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}
