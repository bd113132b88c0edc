#ifndef ERRORS_HPP
#define ERRORS_HPP
#include <optional>
#include <stdexcept>
#include <string>
#include "transcript.hpp"

/**
 * @brief Input rejected before any process was spawned.
 */
class ValidationError : public std::runtime_error {
  public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief A command ran and failed: non-zero exit or timeout.
 *
 * Always carries the full transcript of the failed invocation.
 */
class CommandFailedError : public std::runtime_error {
  public:
    CommandFailedError(const std::string& msg, Transcript transcript)
        : std::runtime_error(msg), transcript_(std::move(transcript)) {}

    const Transcript& transcript() const noexcept { return transcript_; }

  private:
    Transcript transcript_;
};

/**
 * @brief The program could not be launched at all.
 *
 * The transcript has no exit code and the launch error in its stderr.
 */
class SpawnError : public CommandFailedError {
  public:
    SpawnError(const std::string& msg, Transcript transcript)
        : CommandFailedError(msg, std::move(transcript)) {}
};

/**
 * @brief Work aborted by an explicit cancel request or a queue timeout.
 *
 * When a running process was interrupted its transcript is attached.
 */
class CancelledError : public std::runtime_error {
  public:
    explicit CancelledError(const std::string& msg) : std::runtime_error(msg) {}
    CancelledError(const std::string& msg, Transcript transcript)
        : std::runtime_error(msg), transcript_(std::move(transcript)) {}

    const std::optional<Transcript>& transcript() const noexcept { return transcript_; }

  private:
    std::optional<Transcript> transcript_;
};

#endif // ERRORS_HPP
