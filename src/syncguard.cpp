/**
 * @file syncguard.cpp
 * @brief CLI entry point wrapping one transfer run.
 *
 * Builds the configuration, sets up diagnostic logging and hands the
 * transfer to run_sync() with the process based invoker.
 */

#include <cstdlib>
#include <iostream>

#include "config_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "sync_wrapper.hpp"
#include "transfer.hpp"
#include "version.hpp"

using namespace syncguard;

static void setup_logging(const LoggingOptions& logging) {
    set_log_level(logging.log_level);
    set_json_logging(logging.json_log);
    set_log_compression(logging.compress_logs);
    if (!logging.debug_log.empty())
        init_logger(logging.debug_log.string(), logging.log_level, logging.max_log_size, 3);
    if (logging.use_syslog)
        init_syslog(logging.syslog_facility);
}

// Variables from the env file reach the transfer tool, as sourcing it would.
static void export_env_file(const Options& opts) {
    for (const auto& kv : opts.env_file_vars) {
        if (setenv(kv.first.c_str(), kv.second.c_str(), 1) != 0)
            log_warning("Could not export variable from env file", {{"name", kv.first}});
    }
}

/**
 * @brief Application entry point.
 *
 * @return The transfer's exit status; 0 for help or version; 1 for usage
 *         errors and unexpected failures.
 */
#ifndef SYNCGUARD_NO_MAIN
int main(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_options(argc, argv, current_environment());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0], std::cerr);
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return 1;
    }
    if (opts.show_help) {
        print_help(argv[0], std::cout);
        return 0;
    }
    if (opts.print_version) {
        std::cout << SYNCGUARD_VERSION << "\n";
        return 0;
    }
    try {
        setup_logging(opts.logging);
        export_env_file(opts);
        ProcessTransferInvoker invoker(opts.transfer_command);
        int rc = run_sync(opts, invoker, std::cout, std::cerr);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
#endif // SYNCGUARD_NO_MAIN
