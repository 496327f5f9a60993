/**
 * @file pplaces.cpp
 * @brief CLI entry point for repository discovery and lifecycle commands.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "help_text.hpp"
#include "lifecycle.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return Zero on success or when printing help/version; the subcommand's
 *         exit code otherwise; 1 on usage, configuration or unexpected errors.
 */
#ifndef PPLACES_NO_MAIN
int main(int argc, char* argv[]) {
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << PPLACES_VERSION << "\n";
            return 0;
        }
        cli::setup_logging(opts.logging);
        if (logger_initialized())
            log_debug("Starting", {{"command", command_name(opts.command)},
                                   {"version", PPLACES_VERSION}});
        ProcessGitClient client;
        int rc = cli::run_command(opts, client);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
#endif // PPLACES_NO_MAIN
