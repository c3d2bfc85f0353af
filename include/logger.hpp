#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <string>
#include <map>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending. When @p max_size is non-zero
 * the file is rotated once it grows past that many bytes, keeping
 * @p max_files older copies (`<path>.1`, `<path>.2`, ...).
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating. `0` disables rotation.
 * @param max_files Number of rotated log files to keep.
 * @return `true` if the file could be opened.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted log lines.
 *
 * @param enable `true` to emit one JSON object per line.
 */
void set_json_logging(bool enable);

/** @brief Gzip rotated files (`<path>.1.gz`, ...) instead of keeping them plain. */
void set_log_compression(bool enable);

/**
 * @brief Mirror every accepted entry to stderr.
 *
 * Works with or without a log file, which lets `--debug` trace a run on the
 * console.
 */
void set_console_logging(bool enable);

/** @return `true` once a log file is open. */
bool logger_initialized();

/**
 * @brief Log a message with the specified severity.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 */
void log_event(LogLevel level, const std::string& message);

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values providing structured context.
 */
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

/** @brief Flush the log file. */
void flush_logger();

/**
 * @brief Close the log file and reset every logger setting to its default.
 */
void shutdown_logger();

#endif // LOGGER_HPP
