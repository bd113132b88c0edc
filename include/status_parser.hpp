#ifndef STATUS_PARSER_HPP
#define STATUS_PARSER_HPP
#include <optional>
#include <string>
#include "repo.hpp"

namespace git {

/**
 * @brief Shape of the `## ` branch header line.
 */
enum class HeaderKind {
    Missing,    ///< No header line at all, treated as detached
    Unborn,     ///< `No commits yet on X`
    Detached,   ///< `HEAD (no branch)`
    NoUpstream, ///< Plain local branch name
    Tracking    ///< `local...remote` with optional `[ahead N, behind M]`
};

/**
 * @brief Decoded branch header.
 */
struct BranchHeader {
    HeaderKind kind = HeaderKind::Missing;
    std::string branch = "detached";
    std::string upstream;
    int ahead = 0;
    int behind = 0;

    bool detached() const { return kind == HeaderKind::Detached || kind == HeaderKind::Missing; }
    bool has_upstream() const { return kind == HeaderKind::Tracking; }
};

/**
 * @brief Parse the text following `## ` in porcelain v1 branch output.
 */
BranchHeader parse_branch_header(const std::string& header);

/**
 * @brief Parse one per-file porcelain line.
 *
 * @return `std::nullopt` for lines too short to carry two status codes, a
 *         separator and a path.
 */
std::optional<ChangedFile> parse_file_entry(const std::string& line);

/**
 * @brief Every condition that makes a repository need attention.
 */
struct AttentionInputs {
    bool dirty = false;
    int ahead = 0;
    int behind = 0;
    int conflicted = 0;
    bool merge_in_progress = false;
    bool rebase_in_progress = false;
    bool fetch_failed = false;
};

/**
 * @brief OR of all attention conditions.
 */
bool needs_attention(const AttentionInputs& in);

/**
 * @brief Convert `git status --porcelain=v1 --branch` output into a summary.
 *
 * Pure function. Merge/rebase markers, the inaccessible flag and the refresh
 * timestamp are left at their defaults for the caller to fill in; the
 * attention flag only reflects what the text shows.
 */
StatusSummary parse_status(const std::string& raw);

} // namespace git

#endif // STATUS_PARSER_HPP
