#pragma once

#include <atomic>
#include <iosfwd>
#include <optional>
#include <string>

#include "options.hpp"
#include "repo_engine.hpp"

namespace cli {

/**
 * @brief Resolve a repository reference given on the command line.
 *
 * Accepts an id, a display name or a path; ids win over names and names
 * over paths. Returns the id or `std::nullopt` when nothing matches.
 */
std::optional<std::string> resolve_repository(const Snapshot& snapshot, const std::string& ref);

/**
 * @brief Print one short outcome line, plus the transcript on failure or
 * when @p show_transcript is set.
 *
 * @return `0` when the action succeeded, `1` otherwise.
 */
int report_result(const RepoActionResult& result, bool show_transcript, std::ostream& out);

/** @brief Render the catalog as one line per repository. */
void print_snapshot(const Snapshot& snapshot, std::ostream& out);

/** @brief Render the settings block. */
void print_settings(const Settings& settings, std::ostream& out);

/** @brief Render a transcript the way failures are shown. */
void print_transcript(const Transcript& t, std::ostream& out);

/**
 * @brief Dispatch @p opts.command against @p engine.
 *
 * Usage errors are written to @p err and yield exit code `2`.
 */
int run_command(const Options& opts, RepoEngine& engine, std::ostream& out, std::ostream& err);

/**
 * @brief Keep auto-refresh running until @p running turns false.
 *
 * Prints the catalog after every pass that changed it.
 */
int run_watch(RepoEngine& engine, const std::atomic<bool>& running, bool json, std::ostream& out);

} // namespace cli
