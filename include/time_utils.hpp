#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <ctime>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format a point in time as local YYYY-MM-DD HH:MM:SS.
 */
std::string format_commit_time(std::time_t t);

/**
 * @brief Format a duration in seconds as a short string like 1h2m3s.
 */
std::string format_duration_short(std::chrono::seconds dur);

/**
 * @brief Describe how long ago something happened using its largest unit.
 *
 * Produces `just now`, `5m ago`, `3h ago`, `12d ago`. Negative durations
 * (timestamps in the future) yield `in future`.
 */
std::string format_age(std::chrono::seconds dur);

#endif // TIME_UTILS_HPP
