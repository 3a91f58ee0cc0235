#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_usage(const char* prog, std::ostream& os) {
    os << "Usage: " << prog << " [options] <source> <destination> [transfer options...]\n";
}

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--lock", "", "<path>", "Lock resource (default /var/lock/aws_s3_sync.lock)", "Basics"},
        {"--log", "", "<path>", "Audit log file (default /var/log/aws_s3_sync.log)", "Basics"},
        {"--transfer-cmd", "", "<cmd>", "Transfer command (default \"aws s3 sync\")", "Basics"},
        {"--show-output", "-o", "", "Print the transfer output on success (alias --o)",
         "Basics"},
        {"--lock-type", "", "<flock|dir>", "flock on a file or an atomic lock directory",
         "Lock"},
        {"--lock-scope", "", "<log|operation>", "Hold the lock for the log write or the whole run",
         "Lock"},
        {"--no-wait", "", "", "Fail instead of waiting for a busy lock", "Lock"},
        {"--lock-retry", "", "<ms|s>", "Retry delay while waiting for a lock directory", "Lock"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--env-file", "", "<file>", "Load KEY=VALUE defaults (default .env.aws_s3_sync)",
         "Config"},
        {"--debug-log", "", "<path>", "File for diagnostic logs", "Logging"},
        {"--log-level", "", "<level>", "Set diagnostic log verbosity", "Logging"},
        {"--verbose", "", "", "Echo transfer output and log at DEBUG level", "Logging"},
        {"--json-log", "", "", "Write diagnostic logs as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --debug-log when over this size", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated diagnostic logs", "Logging"},
        {"--syslog", "", "", "Log to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility", "Logging"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    auto flag_text = [](const OptionInfo& o) {
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        return flag;
    };
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_text(o).size());
    }

    os << "syncguard - serialized transfer wrapper with an audit log\n";
    os << "Runs the transfer command once and appends one JSON record per run to the log.\n\n";
    print_usage(prog, os);
    os << "\n";
    const std::vector<std::string> order{"Basics", "Lock", "Config", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_text(*o) << o->desc
               << "\n";
        os << "\n";
    }
    os << "Exit status is the transfer's own; 1 for usage errors or a busy lock with --no-wait.\n";
}
