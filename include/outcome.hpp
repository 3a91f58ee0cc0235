#ifndef OUTCOME_HPP
#define OUTCOME_HPP
#include <string>

namespace syncguard {

enum class Outcome { SUCCESS, GENERAL_ERROR, PERMISSION_ERROR, UNSPECIFIED_ERROR };

/// Severity written to the audit record.
enum class RecordStatus { INFO, ERR };

struct Classification {
    Outcome outcome = Outcome::SUCCESS;
    RecordStatus status = RecordStatus::INFO;
    std::string message;
};

/**
 * @brief Map a transfer exit status to its outcome and log message.
 *
 * 0 is success, 1 a general failure and 2 a permission failure, matching the
 * codes the sync tool reserves. Every other value is an unspecified failure.
 * The exit status itself is never altered by classification.
 */
Classification classify_exit_status(int exit_status);

const char* outcome_name(Outcome outcome);

/// "info" or "error".
const char* record_status_name(RecordStatus status);

/// Inverse of record_status_name(). Throws std::invalid_argument for other text.
RecordStatus parse_record_status(const std::string& name);

} // namespace syncguard

#endif // OUTCOME_HPP
