#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

/// Deepest directory level below a native root that is still inspected.
constexpr std::size_t NATIVE_SCAN_MAX_DEPTH = 8;

/**
 * @brief Walk a native discovery root looking for working trees.
 *
 * A directory holding `.git` is reported and not descended into. Symbolic
 * links are never followed and any path matching an ignore token is pruned
 * together with everything below it. Unreadable directories are skipped.
 *
 * @param root      Directory to start from (depth 0).
 * @param ignore    Case-insensitive substring tokens.
 * @param max_depth Maximum depth to inspect.
 * @return Repository paths in traversal order.
 */
std::vector<std::filesystem::path> find_native_repositories(
    const std::filesystem::path& root, const std::vector<std::string>& ignore,
    std::size_t max_depth = NATIVE_SCAN_MAX_DEPTH);

/**
 * @brief Shell script listing the `.git` directories below @p root in a guest.
 *
 * Prints nothing when the root does not exist.
 */
std::string guest_find_script(const std::string& root);

/**
 * @brief Turn the output of @ref guest_find_script into repository paths.
 *
 * Blank lines and paths matching an ignore token are dropped and the trailing
 * `/.git` is removed.
 */
std::vector<std::string> parse_guest_find_output(const std::string& output,
                                                 const std::vector<std::string>& ignore);

#endif // SCANNER_HPP
