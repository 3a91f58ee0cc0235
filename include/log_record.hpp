#ifndef LOG_RECORD_HPP
#define LOG_RECORD_HPP
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "invocation.hpp"
#include "outcome.hpp"

namespace syncguard {

/// Nested payload describing the transfer behind a record.
struct TransferDetail {
    std::string source;
    std::string destination;
    std::string options;                  ///< forwarded options joined by spaces
    std::vector<std::string> option_list; ///< forwarded options as passed
    std::string output;                   ///< combined stdout/stderr of the tool
    std::string start_time;               ///< ISO-8601 UTC
    std::string end_time;                 ///< ISO-8601 UTC
    std::string duration;                 ///< HH:MM:SS
    std::int64_t duration_ms = 0;
    int exit_code = 0;
};

/// One line of the audit log.
struct LogRecord {
    std::string timestamp; ///< ISO-8601 UTC time the record was built
    std::string invocation_id;
    RecordStatus status = RecordStatus::INFO;
    std::string message;
    TransferDetail detail;
};

void to_json(nlohmann::json& j, const TransferDetail& d);
void from_json(const nlohmann::json& j, TransferDetail& d);
void to_json(nlohmann::json& j, const LogRecord& r);
void from_json(const nlohmann::json& j, LogRecord& r);

/**
 * @brief Assemble the record for a completed invocation.
 */
LogRecord build_record(const Invocation& inv, const Classification& cls);

/**
 * @brief Serialize a record to exactly one line, terminated by '\n'.
 *
 * All free-form text is JSON-escaped, so embedded newlines and control
 * characters cannot split the line. Bytes that are not valid UTF-8 are
 * replaced by U+FFFD instead of failing the write.
 */
std::string serialize_record(const LogRecord& record);

/**
 * @brief Parse one audit log line back into a record.
 *
 * @throws nlohmann::json::exception on malformed input.
 */
LogRecord parse_record(const std::string& line);

} // namespace syncguard

#endif // LOG_RECORD_HPP
