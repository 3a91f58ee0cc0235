#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

/*
 * Diagnostic logger. This is the operator-facing trace of what the wrapper
 * did (lock waits, spawned commands, failures). The audit log of transfer
 * outcomes is written separately by audit_log.hpp.
 */

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path and configures log rotation parameters.
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
 * @brief Set the global minimum log level.
 */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit logs as JSON objects instead of plain
 *               text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated files instead of keeping them as plain text.
 */
void set_log_compression(bool enable);

/**
 * @brief Check whether the logger has an open file sink.
 */
bool logger_initialized();

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
 * Works with or without a file sink.
 */
void init_syslog(int facility);

/**
 * @brief Flush buffered output of the file sink.
 */
void flush_logger();

/**
 * @brief Shut down the logging subsystem and release resources.
 */
void shutdown_logger();

#endif // LOGGER_HPP
