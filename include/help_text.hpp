#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP
#include <ostream>

/**
 * @brief Print the usage text grouped by option category.
 *
 * @param prog Program name shown in the usage lines.
 * @param os   Destination stream (stdout for `--help`, stderr after a usage error).
 */
void print_help(const char* prog, std::ostream& os);

#endif // HELP_TEXT_HPP
