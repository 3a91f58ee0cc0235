#include "outcome.hpp"
#include <stdexcept>

namespace syncguard {

Classification classify_exit_status(int exit_status) {
    switch (exit_status) {
    case 0:
        return {Outcome::SUCCESS, RecordStatus::INFO, "Sync successful."};
    case 1:
        return {Outcome::GENERAL_ERROR, RecordStatus::ERR,
                "Sync failed due to a general error, exit code 1"};
    case 2:
        return {Outcome::PERMISSION_ERROR, RecordStatus::ERR,
                "Sync failed due to a permission error, exit code 2"};
    default:
        return {Outcome::UNSPECIFIED_ERROR, RecordStatus::ERR,
                "Sync failed with exit code " + std::to_string(exit_status) + "."};
    }
}

const char* outcome_name(Outcome outcome) {
    switch (outcome) {
    case Outcome::SUCCESS:
        return "success";
    case Outcome::GENERAL_ERROR:
        return "general error";
    case Outcome::PERMISSION_ERROR:
        return "permission error";
    case Outcome::UNSPECIFIED_ERROR:
        return "unspecified error";
    }
    return "unspecified error";
}

const char* record_status_name(RecordStatus status) {
    return status == RecordStatus::INFO ? "info" : "error";
}

RecordStatus parse_record_status(const std::string& name) {
    if (name == "info")
        return RecordStatus::INFO;
    if (name == "error")
        return RecordStatus::ERR;
    throw std::invalid_argument("Unknown record status: " + name);
}

} // namespace syncguard
