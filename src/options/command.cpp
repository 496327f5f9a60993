// command.cpp
//
// Subcommand selection and root resolution.

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "options.hpp"

namespace fs = std::filesystem;

const char* command_name(Command cmd) {
    switch (cmd) {
    case Command::Scan:
        return "scan";
    case Command::Show:
        return "show";
    case Command::Clone:
        return "clone";
    case Command::Upload:
        return "upload";
    case Command::Help:
        return "help";
    case Command::None:
        break;
    }
    return "";
}

fs::path configured_root(const std::string& cli_root, const std::string& cfg_root) {
    if (!cli_root.empty())
        return cli_root;
    if (!cfg_root.empty())
        return cfg_root;
    const char* env = std::getenv("PPLACES_ROOT");
    if (env && *env)
        return env;
    return {};
}

fs::path resolve_show_root(const std::string& cli_root, const std::string& cfg_root) {
    fs::path root = configured_root(cli_root, cfg_root);
    if (!root.empty())
        return root;
    const char* home = std::getenv("HOME");
    if (home && *home)
        return home;
    std::error_code ec;
    root = fs::current_path(ec);
    if (ec)
        throw std::runtime_error("Cannot determine a root directory: " + ec.message());
    return root;
}

void parse_command(Options& opts, const std::vector<std::string>& positional) {
    if (positional.empty())
        return;
    const std::string& name = positional.front();
    std::vector<std::string> rest(positional.begin() + 1, positional.end());
    size_t min_args = 0;
    size_t max_args = 0;
    if (name == "scan") {
        opts.command = Command::Scan;
        min_args = max_args = 1;
    } else if (name == "show") {
        opts.command = Command::Show;
    } else if (name == "clone") {
        opts.command = Command::Clone;
        min_args = 1;
        max_args = 2;
    } else if (name == "upload") {
        opts.command = Command::Upload;
        min_args = max_args = 2;
    } else if (name == "help") {
        opts.command = Command::Help;
        max_args = rest.size();
    } else {
        throw std::runtime_error("Unknown command: " + name);
    }
    if (rest.size() < min_args)
        throw std::runtime_error(name + ": missing argument");
    if (rest.size() > max_args)
        throw std::runtime_error(name + ": unexpected argument '" + rest[max_args] + "'");
    opts.args = std::move(rest);
}
