#pragma once
#include <catch2/catch.hpp>
#include "arg_parser.hpp"
#include "audit_log.hpp"
#include "config_utils.hpp"
#include "invocation.hpp"
#include "lock_utils.hpp"
#include "log_record.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "outcome.hpp"
#include "parse_utils.hpp"
#include "sync_wrapper.hpp"
#include "system_utils.hpp"
#include "time_utils.hpp"
#include "transfer.hpp"
#include "version.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace syncguard::test_support {
namespace detail {
inline bool remove_once(const fs::path& target, bool recursive, std::error_code& ec) {
    ec.clear();
    if (recursive)
        fs::remove_all(target, ec);
    else
        fs::remove(target, ec);
    return !ec || ec == std::errc::no_such_file_or_directory;
}

inline void remove_with_retry(const fs::path& target, bool recursive) {
    std::error_code ec;
    if (remove_once(target, recursive, ec))
        return;
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}
} // namespace detail

inline void remove_path(const fs::path& target) { detail::remove_with_retry(target, false); }

inline void remove_all(const fs::path& target) { detail::remove_with_retry(target, true); }

/// Fresh per-process directory under the temp dir.
inline fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() /
                   ("syncguard_" + name + "_" + std::to_string(static_cast<long>(getpid())));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

/// Owns argv storage for parse_options() and ArgParser.
class Argv {
  public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& s : storage_)
            ptrs_.push_back(s.data());
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return ptrs_.data(); }

  private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

/// Write an executable /bin/sh script.
inline fs::path write_script(const fs::path& path, const std::string& body) {
    {
        std::ofstream ofs(path);
        ofs << "#!/bin/sh\n" << body;
    }
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read);
    return path;
}

inline std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

/// Fork a child that sleeps, giving a PID that is alive until reaped.
inline pid_t spawn_sleeper() {
    pid_t pid = fork();
    if (pid == 0) {
        pause();
        _exit(0);
    }
    return pid;
}

/// A PID that is guaranteed not to be running any more.
inline long dead_pid() {
    pid_t pid = fork();
    if (pid == 0)
        _exit(0);
    int status = 0;
    waitpid(pid, &status, 0);
    return static_cast<long>(pid);
}

inline void reap(pid_t pid) {
    kill(pid, SIGKILL);
    int status = 0;
    waitpid(pid, &status, 0);
}

/// In-process TransferInvoker returning a fixed result.
class FakeInvoker : public syncguard::TransferInvoker {
  public:
    explicit FakeInvoker(int status, std::string output = "")
        : status_(status), output_(std::move(output)) {}

    syncguard::TransferResult run(const std::string& source, const std::string& destination,
                                  const std::vector<std::string>& options) override {
        ++calls;
        last_source = source;
        last_destination = destination;
        last_options = options;
        return {status_, output_};
    }

    int calls = 0;
    std::string last_source;
    std::string last_destination;
    std::vector<std::string> last_options;

  private:
    int status_;
    std::string output_;
};
} // namespace syncguard::test_support

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::syncguard::test_support::remove_path((path))
#endif
#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::syncguard::test_support::remove_all((path))
#endif

using namespace syncguard;
using namespace syncguard::test_support;
