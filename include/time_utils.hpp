#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Get the current UTC time as an ISO-8601 string with milliseconds.
 *
 * Example: `2025-07-31T18:04:05.123Z`. Used for transcript and record
 * timestamps so persisted values sort lexicographically.
 */
std::string iso_timestamp();

/**
 * @brief Format a time point as an ISO-8601 UTC string with milliseconds.
 */
std::string iso_timestamp(std::chrono::system_clock::time_point tp);

/**
 * @brief Format a duration in seconds as a short string like 1h2m3s.
 */
std::string format_duration_short(std::chrono::seconds dur);

#endif // TIME_UTILS_HPP
