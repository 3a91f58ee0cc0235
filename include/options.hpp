#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "lock_utils.hpp"
#include "logger.hpp"

namespace syncguard {

constexpr const char* kDefaultLockPath = "/var/lock/aws_s3_sync.lock";
constexpr const char* kDefaultLogPath = "/var/log/aws_s3_sync.log";
constexpr const char* kDefaultTransferCommand = "aws s3 sync";
constexpr const char* kEnvFileName = ".env.aws_s3_sync";

/// Which part of a run is serialized by the lock.
enum class LockScope {
    LOG_WRITE, ///< only the append of the audit record
    OPERATION  ///< the transfer and the append
};

/// Diagnostic log settings. The audit log is configured by Options::log_path.
struct LoggingOptions {
    std::filesystem::path debug_log;
    LogLevel log_level = LogLevel::INFO;
    size_t max_log_size = 0;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    int syslog_facility = 0;
};

struct Options {
    std::string source;
    std::string destination;
    std::vector<std::string> transfer_options;

    std::filesystem::path lock_path = kDefaultLockPath;
    std::filesystem::path log_path = kDefaultLogPath;
    LockKind lock_kind = LockKind::ADVISORY_FILE;
    LockScope lock_scope = LockScope::LOG_WRITE;
    LockMode lock_mode = LockMode::BLOCKING;
    std::chrono::milliseconds lock_retry = kDefaultLockRetry;

    std::vector<std::string> transfer_command{"aws", "s3", "sync"};
    bool show_output = false;

    bool show_help = false;
    bool print_version = false;

    LoggingOptions logging;
    std::filesystem::path config_file;
    std::filesystem::path env_file;
    /// Assignments read from the env file, exported to the transfer tool.
    std::map<std::string, std::string> env_file_vars;
};

/**
 * @brief Build the run configuration from every source.
 *
 * Precedence from lowest to highest: built-in defaults, @p environment, the
 * env file (`--env-file` or `.env.aws_s3_sync` beside the executable), the
 * YAML or JSON config file and finally the command line.
 *
 * When `--help` or `--version` is given the positionals are not required.
 *
 * @throws std::runtime_error on unknown options, invalid values, unreadable
 *         config files or missing source/destination.
 */
Options parse_options(int argc, char* argv[], const std::map<std::string, std::string>& environment);

/**
 * @brief Location of the env file loaded when `--env-file` is absent.
 *
 * @return The path, or an empty path when no such file exists.
 */
std::filesystem::path default_env_file(const char* argv0);

} // namespace syncguard

#endif // OPTIONS_HPP
