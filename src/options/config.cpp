// config.cpp
//
// Load configuration from YAML/JSON, explicitly named or per-user.

#include <cstdlib>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <system_error>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

fs::path user_config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return fs::path(xdg) / "pplaces";
    const char* home = std::getenv("HOME");
    if (home && *home)
        return fs::path(home) / ".config" / "pplaces";
    return {};
}

static void load_file(const fs::path& cfg, bool yaml,
                      std::map<std::string, std::string>& cfg_opts) {
    std::string err;
    bool ok = yaml ? load_yaml_config(cfg.string(), cfg_opts, err)
                   : load_json_config(cfg.string(), cfg_opts, err);
    if (!ok)
        throw std::runtime_error("Failed to load config " + cfg.string() + ": " + err);
}

void load_config_and_auto(const ArgParser& pre_parser,
                          std::map<std::string, std::string>& cfg_opts, fs::path& config_file) {
    bool explicit_cfg = false;
    if (pre_parser.has_flag("--config-yaml")) {
        std::string cfg = pre_parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        load_file(cfg, true, cfg_opts);
        config_file = cfg;
        explicit_cfg = true;
    }
    if (pre_parser.has_flag("--config-json")) {
        std::string cfg = pre_parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        load_file(cfg, false, cfg_opts);
        config_file = cfg;
        explicit_cfg = true;
    }
    if (explicit_cfg)
        return;

    fs::path dir = user_config_dir();
    if (dir.empty())
        return;
    std::error_code ec;
    fs::path y = dir / "config.yaml";
    fs::path j = dir / "config.json";
    if (fs::is_regular_file(y, ec)) {
        load_file(y, true, cfg_opts);
        config_file = y;
    } else if (fs::is_regular_file(j, ec)) {
        load_file(j, false, cfg_opts);
        config_file = j;
    }
}
