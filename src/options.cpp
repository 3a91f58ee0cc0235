#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "transfer.hpp"

namespace fs = std::filesystem;

namespace syncguard {

namespace {

const std::set<std::string> kKnown{"--lock",          "--log",          "--lock-type",
                                   "--lock-scope",    "--no-wait",      "--lock-retry",
                                   "--transfer-cmd",  "--show-output",  "--o",
                                   "--config-yaml",   "--config-json",  "--env-file",
                                   "--debug-log",     "--log-level",    "--verbose",
                                   "--json-log",      "--max-log-size", "--compress-logs",
                                   "--syslog",        "--syslog-facility", "--help",
                                   "--version"};

const std::set<std::string> kSwitches{"--no-wait",  "--show-output",   "--o",
                                      "--verbose",  "--json-log",      "--compress-logs",
                                      "--syslog",   "--help",          "--version"};

const std::map<char, std::string> kShort{{'h', "--help"},        {'?', "--help"},
                                         {'V', "--version"},     {'o', "--show-output"},
                                         {'y', "--config-yaml"}, {'j', "--config-json"}};

// Options that only make sense on the command line.
const std::set<std::string> kCliOnly{"--config-yaml", "--config-json", "--env-file", "--help",
                                     "--version"};

void merge(std::map<std::string, std::string>& into,
           const std::map<std::string, std::string>& from) {
    for (const auto& kv : from)
        into[kv.first] = kv.second;
}

} // namespace

fs::path default_env_file(const char* argv0) {
    std::error_code ec;
    fs::path exe;
    if (argv0 && std::string(argv0).find('/') != std::string::npos)
        exe = fs::absolute(argv0, ec);
    if (exe.empty())
        exe = fs::read_symlink("/proc/self/exe", ec);
    if (exe.empty())
        return {};
    fs::path candidate = exe.parent_path() / kEnvFileName;
    if (fs::is_regular_file(candidate, ec))
        return candidate;
    return {};
}

Options parse_options(int argc, char* argv[],
                      const std::map<std::string, std::string>& environment) {
    ArgParser parser(argc, argv, kKnown, kShort, kSwitches, 2);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (opts.show_help || opts.print_version)
        return opts;

    // Layered defaults below the command line: environment, env file, config.
    std::map<std::string, std::string> cfg_opts = env_to_options(environment);

    if (parser.has_flag("--env-file")) {
        opts.env_file = parser.get_option("--env-file");
        if (opts.env_file.empty())
            throw std::runtime_error("--env-file requires a file");
    } else {
        opts.env_file = default_env_file(argc > 0 ? argv[0] : nullptr);
    }
    if (!opts.env_file.empty()) {
        std::string err;
        if (!load_env_file(opts.env_file.string(), opts.env_file_vars, err))
            throw std::runtime_error("Failed to load env file " + opts.env_file.string() + ": " +
                                     err);
        merge(cfg_opts, env_to_options(opts.env_file_vars));
    }

    std::map<std::string, std::string> file_opts;
    if (parser.has_flag("--config-yaml")) {
        std::string cfg = parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, file_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        opts.config_file = cfg;
    }
    if (parser.has_flag("--config-json")) {
        std::string cfg = parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, file_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        opts.config_file = cfg;
    }
    for (const auto& kv : file_opts) {
        if (!kKnown.count(kv.first) || kCliOnly.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }
    merge(cfg_opts, file_opts);

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        return it != cfg_opts.end() && parse_bool(it->second);
    };
    // Command line first, then the layered defaults. Empty when neither has it.
    auto value_of = [&](const std::string& k) {
        if (parser.has_flag(k)) {
            std::string v = parser.get_option(k);
            if (v.empty())
                throw std::runtime_error(k + " requires a value");
            return v;
        }
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::string();
    };
    auto present = [&](const std::string& k) {
        return parser.has_flag(k) || cfg_opts.count(k) > 0;
    };

    bool ok = false;

    if (present("--lock")) {
        std::string val = value_of("--lock");
        if (val.empty())
            throw std::runtime_error("--lock requires a path");
        opts.lock_path = val;
    }
    if (present("--log")) {
        std::string val = value_of("--log");
        if (val.empty())
            throw std::runtime_error("--log requires a path");
        opts.log_path = val;
    }
    if (present("--lock-type")) {
        std::string val = value_of("--lock-type");
        if (val == "flock")
            opts.lock_kind = LockKind::ADVISORY_FILE;
        else if (val == "dir")
            opts.lock_kind = LockKind::ATOMIC_DIR;
        else
            throw std::runtime_error("Invalid value for --lock-type");
    }
    if (present("--lock-scope")) {
        std::string val = value_of("--lock-scope");
        if (val == "log")
            opts.lock_scope = LockScope::LOG_WRITE;
        else if (val == "operation")
            opts.lock_scope = LockScope::OPERATION;
        else
            throw std::runtime_error("Invalid value for --lock-scope");
    }
    if (parser.has_flag("--no-wait") || cfg_flag("--no-wait"))
        opts.lock_mode = LockMode::NON_BLOCKING;
    if (present("--lock-retry")) {
        auto retry = parse_time_ms(value_of("--lock-retry"), ok);
        if (!ok || retry.count() <= 0)
            throw std::runtime_error("Invalid value for --lock-retry");
        opts.lock_retry = retry;
    }
    if (present("--transfer-cmd")) {
        std::vector<std::string> cmd = split_command(value_of("--transfer-cmd"));
        if (cmd.empty())
            throw std::runtime_error("Invalid value for --transfer-cmd");
        opts.transfer_command = cmd;
    }
    opts.show_output = parser.has_flag("--show-output") || parser.has_flag("--o") ||
                       cfg_flag("--show-output") || cfg_flag("--o") ||
                       parser.has_flag("--verbose") || cfg_flag("--verbose");

    if (present("--debug-log")) {
        std::string val = value_of("--debug-log");
        if (val.empty())
            throw std::runtime_error("--debug-log requires a path");
        opts.logging.debug_log = val;
    }
    if (parser.has_flag("--verbose") || cfg_flag("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    if (present("--log-level")) {
        std::string val = value_of("--log-level");
        for (auto& c : val)
            c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
        if (val == "DEBUG")
            opts.logging.log_level = LogLevel::DEBUG;
        else if (val == "INFO")
            opts.logging.log_level = LogLevel::INFO;
        else if (val == "WARNING" || val == "WARN")
            opts.logging.log_level = LogLevel::WARNING;
        else if (val == "ERROR")
            opts.logging.log_level = LogLevel::ERR;
        else
            throw std::runtime_error("Invalid log level: " + val);
    }
    if (present("--max-log-size")) {
        opts.logging.max_log_size = parse_bytes(value_of("--max-log-size"), 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    opts.logging.json_log = parser.has_flag("--json-log") || cfg_flag("--json-log");
    opts.logging.compress_logs = parser.has_flag("--compress-logs") || cfg_flag("--compress-logs");
    opts.logging.use_syslog = parser.has_flag("--syslog") || cfg_flag("--syslog");
    if (present("--syslog-facility")) {
        int fac = parse_int(value_of("--syslog-facility"), 0, INT_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --syslog-facility");
        opts.logging.syslog_facility = fac;
    }

    const auto& pos = parser.positional();
    if (pos.size() < 2)
        throw std::runtime_error("Missing <source> and <destination>");
    opts.source = pos[0];
    opts.destination = pos[1];
    opts.transfer_options = parser.remainder();
    return opts;
}

} // namespace syncguard
