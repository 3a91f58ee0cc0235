#ifndef AUDIT_LOG_HPP
#define AUDIT_LOG_HPP
#include <filesystem>
#include <string>
#include <vector>
#include "log_record.hpp"

namespace syncguard {

/**
 * @brief Append one serialized record to the audit log.
 *
 * Missing parent directories are created. The record is written with a
 * single write(2) on an O_APPEND descriptor, so concurrent appenders never
 * interleave bytes of one record. Callers still hold the log lock to keep
 * ordering and to cover short writes.
 *
 * @throws std::system_error when the log cannot be opened or written.
 */
void append_record(const std::filesystem::path& log_path, const std::string& line);

/**
 * @brief Read every record of an audit log in file order.
 *
 * @throws std::system_error when the file cannot be opened and
 *         nlohmann::json::exception when a line is malformed.
 */
std::vector<LogRecord> read_records(const std::filesystem::path& log_path);

} // namespace syncguard

#endif // AUDIT_LOG_HPP
