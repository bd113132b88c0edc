#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <string>
#include <map>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path and configures log rotation parameters. A
 * background worker drains queued messages so callers never block on disk
 * I/O.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Parse a textual level such as `debug` or `WARNING`.
 *
 * @param text  Level name, case-insensitive. `warn` and `error` are accepted.
 * @param level Output level on success.
 * @return `true` when @p text named a known level.
 */
bool parse_log_level(const std::string& text, LogLevel& level);

/**
 * @brief Set the global minimum log level.
 */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files instead of keeping them as plain text.
 */
void set_log_compression(bool enable);

/**
 * @brief Configure how many rotated log files are retained.
 */
void set_log_rotation(size_t max_files);

/**
 * @brief Check whether the logger has been initialized.
 */
bool logger_initialized();

/**
 * @brief Block until every queued message has been written.
 */
void flush_logger();

void log_event(LogLevel level, const std::string& message);
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Mirror log entries to syslog using the specified facility.
 *
 * No-op on platforms without syslog.
 */
void init_syslog(int facility = 0);

/**
 * @brief Shut down the logging subsystem and release resources.
 */
void shutdown_logger();

#endif // LOGGER_HPP
