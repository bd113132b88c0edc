#ifndef TRANSCRIPT_HPP
#define TRANSCRIPT_HPP
#include <optional>
#include <string>

/**
 * @brief Complete record of one external process invocation.
 *
 * Produced by the process executor and never modified afterwards. When the
 * process could not be started @ref exit_code is empty; when it was killed by
 * a signal the code is `128 + signal`.
 */
struct Transcript {
    std::string command;           ///< Program and arguments joined by spaces
    std::optional<int> exit_code;  ///< Exit status, absent if never started
    std::string stdout_text;       ///< Everything written to standard output
    std::string stderr_text;       ///< Everything written to standard error
    std::string started_at;        ///< ISO-8601 UTC start time
    std::string finished_at;       ///< ISO-8601 UTC finish time
    bool timed_out = false;        ///< Terminated by timeout or cancellation

    /** @return `true` when the process exited with code 0 and was not killed. */
    bool succeeded() const { return exit_code && *exit_code == 0 && !timed_out; }
};

inline bool operator==(const Transcript& a, const Transcript& b) {
    return a.command == b.command && a.exit_code == b.exit_code &&
           a.stdout_text == b.stdout_text && a.stderr_text == b.stderr_text &&
           a.started_at == b.started_at && a.finished_at == b.finished_at &&
           a.timed_out == b.timed_out;
}

#endif // TRANSCRIPT_HPP
