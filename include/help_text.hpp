#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

/**
 * @brief Print usage, commands and options grouped by category.
 */
void print_help(const char* prog);

#endif // HELP_TEXT_HPP
