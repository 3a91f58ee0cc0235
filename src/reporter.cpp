#include "reporter.hpp"

namespace syncguard {

void Reporter::report_outcome(const Invocation& inv, const Classification& cls) {
    if (cls.outcome == Outcome::SUCCESS) {
        if (show_output_) {
            out_ << inv.output;
            if (!inv.output.empty() && inv.output.back() != '\n')
                out_ << '\n';
            out_.flush();
        }
        return;
    }
    err_ << "Error.\nExit code " << inv.exit_status << ": " << inv.output;
    if (inv.output.empty() || inv.output.back() != '\n')
        err_ << '\n';
    err_ << "UNIQUE_ID " << inv.id << std::endl;
}

void Reporter::report_log_failure(const Invocation& inv, const std::filesystem::path& log_path,
                                  const std::string& reason) {
    err_ << "Failed to write audit log " << log_path.string() << ": " << reason
         << " (UNIQUE_ID " << inv.id << ")" << std::endl;
}

void Reporter::report_lock_failure(const std::string& invocation_id, const std::string& reason) {
    err_ << "Error.\nCould not acquire lock: " << reason << "\nUNIQUE_ID " << invocation_id
         << std::endl;
}

} // namespace syncguard
