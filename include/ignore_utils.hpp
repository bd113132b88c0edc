#ifndef IGNORE_UTILS_HPP
#define IGNORE_UTILS_HPP
#include <string>
#include <vector>

namespace ignore {

/**
 * Check a path against discovery ignore tokens.
 *
 * Each token is trimmed and lowercased; blank tokens are skipped. The path
 * matches when its lowercased text contains any token as a substring, so
 * `node_modules` excludes every path that has such a component anywhere.
 */
bool matches_token(const std::string& path, const std::vector<std::string>& tokens);

/**
 * Split a comma separated list into trimmed, non-empty entries.
 */
std::vector<std::string> split_list(const std::string& text);

} // namespace ignore

#endif // IGNORE_UTILS_HPP
