#pragma once

#include <iostream>
#include <ostream>

#include "lifecycle.hpp"
#include "options.hpp"
#include "scanner.hpp"

namespace cli {

/**
 * @brief Start the file logger and syslog mirroring requested in @a opts.
 *
 * Does nothing when no log file and no syslog were requested.
 */
void setup_logging(const LoggingOptions& opts);

/**
 * @brief Build the scan configuration for the root selected in @a opts.
 */
ScanConfig make_scan_config(const Options& opts);

/**
 * @brief Run `scan <path>` and print the report.
 *
 * Returns `0` on success and `2` when the path is not a directory. Recovered
 * discovery problems are printed to @a err unless `--silent` is set.
 */
int handle_scan(const Options& opts, std::ostream& out = std::cout,
                std::ostream& err = std::cerr);

/**
 * @brief Run `show` over the resolved root and print the summary report.
 */
int handle_show(const Options& opts, std::ostream& out = std::cout,
                std::ostream& err = std::cerr);

/**
 * @brief Run `clone <url> [<dest>]` through @a client.
 *
 * Returns `4` when the repository is already present, the client's status
 * when it fails and `0` on success.
 */
int handle_clone(const Options& opts, GitClient& client, std::ostream& err = std::cerr);

/**
 * @brief Run `upload <path> <target>` through @a client.
 *
 * Returns `3` when the path is not a repository, the client's status when it
 * fails and `0` on success.
 */
int handle_upload(const Options& opts, GitClient& client, std::ostream& err = std::cerr);

/**
 * @brief Dispatch the subcommand selected in @a opts.
 */
int run_command(const Options& opts, GitClient& client);

} // namespace cli
