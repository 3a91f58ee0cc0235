#ifndef TRANSFER_HPP
#define TRANSFER_HPP
#include <string>
#include <vector>

namespace syncguard {

/// Exit status and combined stdout/stderr of one transfer run.
struct TransferResult {
    int exit_status = 0;
    std::string output;
};

/**
 * @brief Runs the external transfer operation.
 *
 * run() is synchronous: it returns once the transfer finished. Options are
 * forwarded verbatim after the source and destination.
 */
class TransferInvoker {
  public:
    virtual ~TransferInvoker() = default;
    virtual TransferResult run(const std::string& source, const std::string& destination,
                               const std::vector<std::string>& options) = 0;
};

/**
 * @brief TransferInvoker that spawns `<command...> <source> <destination> <options...>`.
 *
 * The program is looked up on PATH. Stdout and stderr of the child share one
 * pipe so the captured text keeps the order the tool produced it in. A child
 * killed by a signal reports `128 + signal`; a program that cannot be
 * executed reports 127.
 *
 * @throws std::system_error when the pipe or the child cannot be created.
 */
class ProcessTransferInvoker : public TransferInvoker {
  public:
    explicit ProcessTransferInvoker(std::vector<std::string> command);

    TransferResult run(const std::string& source, const std::string& destination,
                       const std::vector<std::string>& options) override;

  private:
    std::vector<std::string> command_;
};

/**
 * @brief Split a command line such as `aws s3 sync` on whitespace.
 *
 * Single and double quotes group words; no other shell syntax is supported.
 */
std::vector<std::string> split_command(const std::string& command);

} // namespace syncguard

#endif // TRANSFER_HPP
