#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP
#include <iostream>
#include <ostream>

/**
 * @brief Print usage, subcommands and every option grouped by category.
 *
 * @param prog Program name shown in the usage lines.
 * @param os   Destination stream.
 */
void print_help(const char* prog, std::ostream& os = std::cout);

#endif // HELP_TEXT_HPP
