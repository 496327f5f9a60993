#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "arg_parser.hpp"
#include "ignore_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

// Command-line subcommand handling and root resolution live in
// src/options/command.cpp, configuration loading in src/options/config.cpp.

static const std::set<std::string> kValueFlags{
    "--days-to-show", "--root",        "--threads",     "--ignore",      "--ignore-file",
    "--max-depth",    "--remote",      "--backend",     "--log-file",    "--log-level",
    "--max-log-size", "--max-log-files", "--config-yaml", "--config-json"};

static const std::set<std::string> kSwitchFlags{
    "--full",   "--json",      "--ignore-untracked", "--json-log", "--compress-logs",
    "--syslog", "--silent",    "--help",             "--version"};

static std::vector<std::string> split_lines(const std::string& val) {
    std::vector<std::string> out;
    std::istringstream iss(val);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty())
            out.push_back(line);
    }
    return out;
}

// Patterns naming a path are anchored to the working directory so they compare
// against the absolute paths the walker produces.
static fs::path anchor_pattern(const fs::path& pattern) {
    if (pattern.is_absolute() || pattern.string().find('/') == std::string::npos)
        return pattern;
    std::error_code ec;
    fs::path abs = fs::absolute(pattern, ec);
    return ec ? pattern : abs.lexically_normal();
}

Options parse_options(int argc, char* argv[]) {
    std::set<std::string> known = kSwitchFlags;
    known.insert(kValueFlags.begin(), kValueFlags.end());
    const std::map<char, std::string> short_opts{{'d', "--days-to-show"},
                                                 {'f', "--full"},
                                                 {'j', "--json"},
                                                 {'o', "--root"},
                                                 {'t', "--threads"},
                                                 {'I', "--ignore"},
                                                 {'D', "--max-depth"},
                                                 {'l', "--log-file"},
                                                 {'L', "--log-level"},
                                                 {'s', "--silent"},
                                                 {'y', "--config-yaml"},
                                                 {'h', "--help"},
                                                 {'V', "--version"}};
    ArgParser parser(argc, argv, known, short_opts, kValueFlags);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");

    Options opts;
    std::map<std::string, std::string> cfg_opts;
    load_config_and_auto(parser, cfg_opts, opts.config_file);
    for (const auto& kv : cfg_opts) {
        if (!known.count(kv.first) || kv.first == "--config-yaml" ||
            kv.first == "--config-json")
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        std::string v = it->second;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return v == "" || v == "1" || v == "true" || v == "yes";
    };
    auto cfg_opt = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::string();
    };
    auto flag = [&](const std::string& k) { return parser.has_flag(k) || cfg_flag(k); };
    // Command line value if given, otherwise the config value.
    auto value = [&](const std::string& k, std::string& out) {
        if (parser.has_flag(k)) {
            out = parser.get_option(k);
            return true;
        }
        if (cfg_opts.count(k)) {
            out = cfg_opt(k);
            return true;
        }
        return false;
    };

    bool ok = false;
    std::string val;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.full = flag("--full");
    opts.json = flag("--json");
    opts.silent = flag("--silent");
    opts.include_untracked = !flag("--ignore-untracked");

    if (value("--days-to-show", val)) {
        unsigned int days = parse_uint(val, 0, UINT_MAX / 86400u, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --days-to-show");
        opts.days_to_show = days;
    }
    if (value("--threads", val)) {
        opts.concurrency = parse_size_t(val, 0, 1024, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --threads");
        if (opts.concurrency == 0)
            opts.concurrency = std::max(1u, std::thread::hardware_concurrency());
    }
    if (value("--max-depth", val)) {
        opts.max_depth = parse_size_t(val, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-depth");
    }
    if (value("--remote", val)) {
        if (val.empty())
            throw std::runtime_error("--remote requires a name");
        opts.remote_name = val;
    }
    if (value("--backend", val)) {
        if (val != "libgit2" && val != "cli")
            throw std::runtime_error("Invalid value for --backend: " + val);
        opts.backend = val;
    }

    std::vector<std::string> ignores;
    if (parser.has_flag("--ignore")) {
        ignores = parser.get_all_options("--ignore");
    } else if (cfg_opts.count("--ignore")) {
        ignores = split_lines(cfg_opt("--ignore"));
    }
    for (const auto& pat : ignores) {
        if (pat.empty())
            throw std::runtime_error("--ignore requires a directory");
        opts.ignore_dirs.push_back(anchor_pattern(pat));
    }
    if (value("--ignore-file", val)) {
        std::error_code ec;
        if (!fs::is_regular_file(val, ec))
            throw std::runtime_error("Ignore file not found: " + val);
        for (const auto& pat : ignore::read_ignore_file(val))
            opts.ignore_dirs.push_back(anchor_pattern(pat));
    }

    if (value("--log-file", val)) {
        if (val.empty())
            throw std::runtime_error("--log-file requires a path");
        opts.logging.log_file = val;
    }
    if (value("--log-level", val)) {
        opts.logging.log_level = parse_log_level(val, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --log-level");
    }
    if (value("--max-log-size", val)) {
        opts.logging.max_log_size = parse_bytes(val, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (value("--max-log-files", val)) {
        opts.logging.max_log_files = parse_size_t(val, 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    opts.logging.json_log = flag("--json-log");
    opts.logging.compress_logs = flag("--compress-logs");
    opts.logging.use_syslog = flag("--syslog");
    if (opts.logging.use_syslog && opts.logging.log_file.empty())
        throw std::runtime_error("--syslog requires --log-file");

    parse_command(opts, parser.positional());
    if (opts.command == Command::Help)
        opts.show_help = true;
    if (opts.command == Command::None && !opts.show_help && !opts.print_version)
        throw std::runtime_error("Missing command. Run with --help for usage.");

    std::string cli_root = parser.get_option("--root");
    if (parser.has_flag("--root") && cli_root.empty())
        throw std::runtime_error("--root requires a path");
    std::string cfg_root = cfg_opt("--root");
    opts.search_root = configured_root(cli_root, cfg_root);
    if (opts.command == Command::Scan)
        opts.root = opts.args.front();
    else if (opts.command == Command::Show)
        opts.root = resolve_show_root(cli_root, cfg_root);
    return opts;
}
