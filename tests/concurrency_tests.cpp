#include "test_common.hpp"
#include <unordered_set>

// Fork `count` processes that each run one wrapped transfer against the same
// log and lock, then wait for all of them.
static std::vector<int> run_concurrently(const Options& opts, int count) {
    std::vector<pid_t> children;
    for (int i = 0; i < count; ++i) {
        pid_t pid = fork();
        if (pid == 0) {
            ProcessTransferInvoker invoker(opts.transfer_command);
            std::ostringstream out, err;
            int rc = run_sync(opts, invoker, out, err);
            _exit(rc);
        }
        children.push_back(pid);
    }
    std::vector<int> codes;
    for (pid_t pid : children) {
        int status = 0;
        waitpid(pid, &status, 0);
        codes.push_back(WIFEXITED(status) ? WEXITSTATUS(status) : -1);
    }
    return codes;
}

static void require_complete_records(const fs::path& log, int count) {
    auto lines = read_lines(log);
    REQUIRE(lines.size() == static_cast<size_t>(count));
    std::unordered_set<std::string> ids;
    for (const auto& line : lines) {
        LogRecord rec = parse_record(line);
        ids.insert(rec.invocation_id);
        REQUIRE(rec.detail.output.size() > 4000);
    }
    REQUIRE(ids.size() == static_cast<size_t>(count));
}

TEST_CASE("Concurrent invocations write complete records") {
    fs::path dir = make_temp_dir("concurrent");
    // Output larger than PIPE_BUF so unsynchronized appends could tear.
    fs::path script = write_script(dir / "tool.sh", "i=0\nwhile [ $i -lt 200 ]; do\n"
                                                    "  echo \"$1 line $i of the transfer\"\n"
                                                    "  i=$((i+1))\ndone\nexit 0\n");
    for (auto kind : {LockKind::ADVISORY_FILE, LockKind::ATOMIC_DIR}) {
        for (auto scope : {LockScope::LOG_WRITE, LockScope::OPERATION}) {
            fs::path log = dir / (std::string(lock_kind_name(kind)) +
                                  (scope == LockScope::OPERATION ? "_op" : "_log") + ".log");
            Options opts;
            opts.source = "src";
            opts.destination = "dst";
            opts.lock_path = dir / (std::string(lock_kind_name(kind)) + ".lock");
            opts.log_path = log;
            opts.lock_kind = kind;
            opts.lock_scope = scope;
            opts.lock_retry = std::chrono::milliseconds(5);
            opts.transfer_command = {script.string()};
            const int count = 8;
            auto codes = run_concurrently(opts, count);
            for (int rc : codes)
                REQUIRE(rc == 0);
            require_complete_records(log, count);
        }
    }
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Non-blocking operation scope skips transfers while the lock is held") {
    fs::path dir = make_temp_dir("concurrent_nowait");
    fs::path script = write_script(dir / "quick.sh", "exit 0\n");
    Options opts;
    opts.source = "src";
    opts.destination = "dst";
    opts.lock_path = dir / "sync.lock";
    opts.log_path = dir / "sync.log";
    opts.lock_scope = LockScope::OPERATION;
    opts.lock_mode = LockMode::NON_BLOCKING;
    opts.transfer_command = {script.string()};

    FileRegionLock holder(opts.lock_path);
    holder.acquire();
    auto codes = run_concurrently(opts, 4);
    holder.release();
    for (int rc : codes)
        REQUIRE(rc == 1);
    REQUIRE_FALSE(fs::exists(opts.log_path));

    codes = run_concurrently(opts, 1);
    REQUIRE(codes.front() == 0);
    REQUIRE(read_lines(opts.log_path).size() == 1);
    FS_REMOVE_ALL(dir);
}
