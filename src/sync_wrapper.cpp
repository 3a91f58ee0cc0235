#include "sync_wrapper.hpp"
#include <memory>
#include <string>
#include <system_error>
#include "audit_log.hpp"
#include "invocation.hpp"
#include "lock_utils.hpp"
#include "log_record.hpp"
#include "logger.hpp"
#include "outcome.hpp"
#include "reporter.hpp"
#include "time_utils.hpp"

namespace syncguard {

namespace {

void run_transfer(Invocation& inv, TransferInvoker& invoker) {
    TimingTracker timer;
    TransferResult result;
    timer.start();
    try {
        result = invoker.run(inv.source, inv.destination, inv.options);
    } catch (const std::exception& e) {
        log_error("Transfer could not be started", {{"id", inv.id}, {"error", e.what()}});
        result.exit_status = 1;
        result.output = e.what();
    }
    timer.stop();
    inv.record_result(result.exit_status, std::move(result.output), timer.start_time(),
                      timer.end_time(), timer.elapsed());
}

// Returns the failure reason, or an empty string when the record was written.
std::string write_record(const Options& opts, Lock& lock, const std::string& line) {
    try {
        if (opts.lock_scope == LockScope::OPERATION) {
            append_record(opts.log_path, line);
        } else {
            LockGuard guard(lock, opts.lock_mode);
            append_record(opts.log_path, line);
        }
    } catch (const LockError& e) {
        return e.what();
    } catch (const std::system_error& e) {
        return e.what();
    }
    return "";
}

} // namespace

int run_sync(const Options& opts, TransferInvoker& invoker, std::ostream& out,
             std::ostream& err) {
    Invocation inv;
    inv.id = make_invocation_id();
    inv.source = opts.source;
    inv.destination = opts.destination;
    inv.options = opts.transfer_options;

    Reporter reporter(out, err, opts.show_output);
    auto lock = make_lock(opts.lock_kind, opts.lock_path, opts.lock_retry);
    log_debug("Invocation started", {{"id", inv.id},
                                     {"source", inv.source},
                                     {"destination", inv.destination},
                                     {"lock", opts.lock_path.string()},
                                     {"lock_type", lock_kind_name(opts.lock_kind)}});

    std::unique_ptr<LockGuard> op_guard;
    if (opts.lock_scope == LockScope::OPERATION) {
        try {
            op_guard = std::make_unique<LockGuard>(*lock, opts.lock_mode);
        } catch (const LockError& e) {
            log_warning("Transfer skipped, lock unavailable", {{"id", inv.id}, {"error", e.what()}});
            reporter.report_lock_failure(inv.id, e.what());
            return 1;
        }
    }

    run_transfer(inv, invoker);
    Classification cls = classify_exit_status(inv.exit_status);
    std::string line = serialize_record(build_record(inv, cls));
    std::string failure = write_record(opts, *lock, line);
    op_guard.reset();

    if (failure.empty()) {
        log_info("Transfer recorded", {{"id", inv.id},
                                       {"exit_code", std::to_string(inv.exit_status)},
                                       {"outcome", outcome_name(cls.outcome)}});
    } else {
        log_error("Failed to write audit log", {{"id", inv.id}, {"error", failure}});
        reporter.report_log_failure(inv, opts.log_path, failure);
    }
    reporter.report_outcome(inv, cls);
    return inv.exit_status;
}

} // namespace syncguard
