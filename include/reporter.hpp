#ifndef REPORTER_HPP
#define REPORTER_HPP
#include <filesystem>
#include <ostream>
#include <string>
#include "invocation.hpp"
#include "outcome.hpp"

namespace syncguard {

/**
 * @brief Caller-facing output of the wrapper.
 *
 * Every failure message carries the invocation id so it can be matched with
 * its audit log entry.
 */
class Reporter {
  public:
    Reporter(std::ostream& out, std::ostream& err, bool show_output)
        : out_(out), err_(err), show_output_(show_output) {}

    /// Success prints the captured output when enabled; failures go to err.
    void report_outcome(const Invocation& inv, const Classification& cls);

    /// The record could not be appended to the audit log.
    void report_log_failure(const Invocation& inv, const std::filesystem::path& log_path,
                            const std::string& reason);

    /// The lock could not be taken, so the transfer never ran.
    void report_lock_failure(const std::string& invocation_id, const std::string& reason);

  private:
    std::ostream& out_;
    std::ostream& err_;
    bool show_output_;
};

} // namespace syncguard

#endif // REPORTER_HPP
