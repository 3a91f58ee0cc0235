#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP
#include <ostream>

/**
 * @brief Print command line usage grouped by category.
 *
 * @param prog Program name shown in the usage line.
 * @param os   Destination stream.
 */
void print_help(const char* prog, std::ostream& os);

/// One-line usage summary, used after argument errors.
void print_usage(const char* prog, std::ostream& os);

#endif // HELP_TEXT_HPP
