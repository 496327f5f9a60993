#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "logger.hpp"

/**
 * @brief Subcommand selected on the command line.
 */
enum class Command { None, Scan, Show, Clone, Upload, Help };

/** @return Command name as typed by the user, e.g. `scan`. */
const char* command_name(Command cmd);

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
};

struct Options {
    Command command = Command::None;
    std::vector<std::string> args;        ///< Positional arguments after the subcommand
    std::filesystem::path root;           ///< Scan root of `scan` and `show`
    std::filesystem::path search_root;    ///< Explicitly configured root, may be empty
    std::optional<unsigned int> days_to_show;
    bool full = false;
    bool json = false;
    bool silent = false;
    size_t concurrency = 1;
    std::vector<std::filesystem::path> ignore_dirs;
    size_t max_depth = 0;
    std::string remote_name = "origin";
    std::string backend = "libgit2";
    bool include_untracked = true;
    LoggingOptions logging;
    std::filesystem::path config_file;
    bool show_help = false;
    bool print_version = false;
};

/**
 * Parse command-line arguments and configuration files to populate an Options
 * instance.
 *
 * Configuration values apply first and command-line flags override them.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Fully populated Options structure.
 * @throws std::runtime_error on unknown flags, invalid values, a malformed
 *         configuration file or a wrong subcommand arity.
 */
Options parse_options(int argc, char* argv[]);

class ArgParser;

/**
 * Load the configuration file named by `--config-yaml`/`--config-json`, or
 * the per-user file when neither is given.
 *
 * @param parser      Parsed command line.
 * @param cfg_opts    Receives the flattened option map.
 * @param config_file Receives the path of the file that was loaded, if any.
 * @throws std::runtime_error when a named file cannot be loaded.
 */
void load_config_and_auto(const ArgParser& parser, std::map<std::string, std::string>& cfg_opts,
                          std::filesystem::path& config_file);

/**
 * Directory holding the per-user configuration: `$XDG_CONFIG_HOME/pplaces`,
 * else `$HOME/.config/pplaces`. Empty when neither variable is set.
 */
std::filesystem::path user_config_dir();

/**
 * Root configured by the user: @p cli_root, then @p cfg_root, then the
 * `PPLACES_ROOT` environment variable. Empty when none is set.
 */
std::filesystem::path configured_root(const std::string& cli_root, const std::string& cfg_root);

/**
 * Root used by `show`: the configured root, then `$HOME`, then the current
 * directory.
 */
std::filesystem::path resolve_show_root(const std::string& cli_root, const std::string& cfg_root);

/**
 * Set the subcommand fields of @p opts from the positional arguments.
 *
 * @throws std::runtime_error for an unknown subcommand or a wrong number of
 *         arguments.
 */
void parse_command(Options& opts, const std::vector<std::string>& positional);

#endif // OPTIONS_HPP
