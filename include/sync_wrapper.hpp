#ifndef SYNC_WRAPPER_HPP
#define SYNC_WRAPPER_HPP
#include <ostream>
#include "options.hpp"
#include "transfer.hpp"

namespace syncguard {

/**
 * @brief Run one serialized transfer and record it in the audit log.
 *
 * Generates the invocation id, runs @p invoker under the configured lock
 * scope, appends exactly one record and reports to @p out / @p err after
 * the lock is released.
 *
 * @return The transfer's exit status, or 1 when the lock was busy in
 *         non-blocking operation scope. A failed log write never changes the
 *         returned status.
 */
int run_sync(const Options& opts, TransferInvoker& invoker, std::ostream& out, std::ostream& err);

} // namespace syncguard

#endif // SYNC_WRAPPER_HPP
