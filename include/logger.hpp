#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Parse a level name such as `DEBUG` or `warning`.
 *
 * @param name Case-insensitive level name; `ERR` and `ERROR` are both accepted.
 * @param ok   Set to `false` when @p name is not a known level.
 * @return Parsed level, or LogLevel::INFO when unknown.
 */
LogLevel parse_log_level(const std::string& name, bool& ok);

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and starts the background
 * writer thread. Calling it again switches to the new file.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/** @brief Emit one JSON object per line instead of plain text. */
void set_json_logging(bool enable);

/** @brief Gzip rotated log files. */
void set_log_compression(bool enable);

/**
 * @brief Check whether the logger has been initialized.
 *
 * @return `true` if a log file is open.
 */
bool logger_initialized();

/** @brief Block until every queued message has been written. */
void flush_logger();

/**
 * @brief Log a message, optionally with structured key/value fields.
 *
 * Fields are appended as `key=value` pairs in text mode and as extra members
 * in JSON mode.
 */
void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Mirror log lines to syslog under the `pplaces` ident.
 *
 * @param facility Syslog facility; `0` selects `LOG_USER`.
 */
void init_syslog(int facility = 0);

/**
 * @brief Stop the writer thread, flush and close the log file.
 */
void shutdown_logger();

#endif // LOGGER_HPP
