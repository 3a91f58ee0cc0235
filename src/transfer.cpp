#include "transfer.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include "logger.hpp"
#include "system_utils.hpp"

namespace syncguard {

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> out;
    std::string cur;
    bool in_word = false;
    char quote = 0;
    for (char c : command) {
        if (quote) {
            if (c == quote)
                quote = 0;
            else
                cur += c;
        } else if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (in_word) {
                out.push_back(cur);
                cur.clear();
                in_word = false;
            }
        } else {
            cur += c;
            in_word = true;
        }
    }
    if (quote)
        throw std::runtime_error("Unterminated quote in transfer command: " + command);
    if (in_word)
        out.push_back(cur);
    return out;
}

ProcessTransferInvoker::ProcessTransferInvoker(std::vector<std::string> command)
    : command_(std::move(command)) {
    if (command_.empty())
        throw std::invalid_argument("Transfer command is empty");
}

TransferResult ProcessTransferInvoker::run(const std::string& source,
                                           const std::string& destination,
                                           const std::vector<std::string>& options) {
    std::vector<std::string> args = command_;
    args.push_back(source);
    args.push_back(destination);
    args.insert(args.end(), options.begin(), options.end());

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw std::system_error(errno, std::generic_category(), "pipe");
    UniqueFd read_end(fds[0]);
    UniqueFd write_end(fds[1]);

    const std::string exec_error = "syncguard: cannot execute " + args.front() + ": ";
    log_debug("Spawning transfer",
              {{"program", args.front()}, {"argc", std::to_string(args.size())}});
    pid_t pid = fork();
    if (pid < 0)
        throw std::system_error(errno, std::generic_category(), "fork");
    if (pid == 0) {
        // With stdout or stderr closed the pipe may already sit on the target
        // descriptor, where dup2 is a no-op that keeps FD_CLOEXEC.
        for (int target : {STDOUT_FILENO, STDERR_FILENO}) {
            if (write_end.get() == target) {
                if (fcntl(target, F_SETFD, 0) < 0)
                    _exit(127);
            } else if (dup2(write_end.get(), target) < 0) {
                _exit(127);
            }
        }
        execvp(argv[0], argv.data());
        const char* err = std::strerror(errno);
        ssize_t w = write(STDERR_FILENO, exec_error.data(), exec_error.size());
        w = write(STDERR_FILENO, err, std::strlen(err));
        w = write(STDERR_FILENO, "\n", 1);
        (void)w;
        _exit(127);
    }
    write_end.reset();

    TransferResult result;
    char buf[65536];
    while (true) {
        ssize_t n = read(read_end.get(), buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0)
            log_warning("Reading transfer output failed", {{"error", std::strerror(errno)}});
        break;
    }
    read_end.reset();

    int status = 0;
    pid_t w;
    do {
        w = waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w < 0)
        throw std::system_error(errno, std::generic_category(), "waitpid");
    if (WIFEXITED(status))
        result.exit_status = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exit_status = 128 + WTERMSIG(status);
    else
        result.exit_status = 1;
    log_debug("Transfer finished", {{"exit_code", std::to_string(result.exit_status)},
                                    {"output_bytes", std::to_string(result.output.size())}});
    return result;
}

} // namespace syncguard
