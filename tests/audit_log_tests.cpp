#include "test_common.hpp"
#include <sys/resource.h>

static std::string record_line(const std::string& id, int status) {
    Invocation inv;
    inv.id = id;
    inv.source = "src";
    inv.destination = "dst";
    auto now = std::chrono::system_clock::now();
    inv.record_result(status, "out", now, now, std::chrono::milliseconds(0));
    return serialize_record(build_record(inv, classify_exit_status(status)));
}

TEST_CASE("append_record creates missing directories") {
    fs::path dir = make_temp_dir("audit_mkdir");
    fs::path log = dir / "nested" / "deeper" / "sync.log";
    append_record(log, record_line("a", 0));
    REQUIRE(fs::exists(log));
    auto records = read_records(log);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].invocation_id == "a");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("append_record appends in order") {
    fs::path dir = make_temp_dir("audit_order");
    fs::path log = dir / "sync.log";
    {
        std::ofstream ofs(log);
        ofs << record_line("existing", 0);
    }
    append_record(log, record_line("first", 1));
    append_record(log, record_line("second", 42));
    auto records = read_records(log);
    REQUIRE(records.size() == 3);
    REQUIRE(records[0].invocation_id == "existing");
    REQUIRE(records[1].invocation_id == "first");
    REQUIRE(records[2].invocation_id == "second");
    REQUIRE(records[2].detail.exit_code == 42);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("append_record reports unwritable logs") {
    fs::path dir = make_temp_dir("audit_fail");
    fs::path blocker = dir / "file";
    {
        std::ofstream ofs(blocker);
        ofs << "not a directory";
    }
    // The parent of the log is a regular file, so the log cannot exist.
    REQUIRE_THROWS_AS(append_record(blocker / "sync.log", record_line("x", 0)),
                      std::system_error);
    REQUIRE_THROWS_AS(append_record(dir, record_line("x", 0)), std::system_error);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("read_records fails on a missing log") {
    REQUIRE_THROWS_AS(read_records(fs::temp_directory_path() / "syncguard_missing_audit.log"),
                      std::system_error);
}

TEST_CASE("append_record leaves no partial record when a write fails") {
    fs::path dir = make_temp_dir("audit_partial");
    fs::path log = dir / "sync.log";
    append_record(log, record_line("first", 0));
    auto before = fs::file_size(log);

    Invocation big;
    big.id = "big";
    big.source = "src";
    big.destination = "dst";
    auto now = std::chrono::system_clock::now();
    big.record_result(0, std::string(5000, 'x'), now, now, std::chrono::milliseconds(0));
    std::string big_line = serialize_record(build_record(big, classify_exit_status(0)));

    // The file size limit is applied in a child so it cannot leak into other cases.
    pid_t pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        signal(SIGXFSZ, SIG_IGN);
        struct rlimit lim{};
        getrlimit(RLIMIT_FSIZE, &lim);
        lim.rlim_cur = static_cast<rlim_t>(before + 100);
        if (setrlimit(RLIMIT_FSIZE, &lim) != 0)
            _exit(2);
        try {
            append_record(log, big_line);
        } catch (const std::system_error&) {
            _exit(0);
        }
        _exit(1);
    }
    int status = 0;
    waitpid(pid, &status, 0);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 0);
    REQUIRE(fs::file_size(log) == before);

    append_record(log, record_line("second", 1));
    auto records = read_records(log);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].invocation_id == "first");
    REQUIRE(records[1].invocation_id == "second");
    FS_REMOVE_ALL(dir);
}
