#include "test_common.hpp"
#include <unordered_set>

TEST_CASE("Invocation ids are unique") {
    std::unordered_set<std::string> ids;
    for (int i = 0; i < 10000; ++i)
        ids.insert(make_invocation_id());
    REQUIRE(ids.size() == 10000);
}

TEST_CASE("Invocation id carries the process id") {
    std::string id = make_invocation_id();
    std::string pid = "-" + std::to_string(static_cast<long>(getpid())) + "-";
    REQUIRE(id.find(pid) != std::string::npos);
    REQUIRE(id.find(' ') == std::string::npos);
}

TEST_CASE("Invocation result is recorded once") {
    Invocation inv;
    auto t0 = std::chrono::system_clock::now();
    auto t1 = t0 + std::chrono::seconds(3);
    inv.record_result(2, "denied", t0, t1, std::chrono::milliseconds(3000));
    REQUIRE(inv.completed);
    inv.record_result(0, "ignored", t1, t1, std::chrono::milliseconds(0));
    REQUIRE(inv.exit_status == 2);
    REQUIRE(inv.output == "denied");
    REQUIRE(inv.start_time == t0);
    REQUIRE(inv.end_time == t1);
    REQUIRE(inv.duration.count() == 3000);
}

TEST_CASE("Invocation joins options with spaces") {
    Invocation inv;
    REQUIRE(inv.options_string().empty());
    inv.options = {"--delete", "--exclude", "*.tmp"};
    REQUIRE(inv.options_string() == "--delete --exclude *.tmp");
}

TEST_CASE("Duration formatting") {
    REQUIRE(format_duration_hms(std::chrono::milliseconds(0)) == "00:00:00");
    REQUIRE(format_duration_hms(std::chrono::milliseconds(999)) == "00:00:00");
    REQUIRE(format_duration_hms(std::chrono::milliseconds(61000)) == "00:01:01");
    REQUIRE(format_duration_hms(std::chrono::hours(27) + std::chrono::minutes(5)) ==
            "27:05:00");
}

TEST_CASE("ISO-8601 UTC formatting") {
    std::chrono::system_clock::time_point epoch{};
    REQUIRE(iso8601_utc(epoch) == "1970-01-01T00:00:00Z");
    REQUIRE(iso8601_utc(epoch + std::chrono::seconds(86400 + 3661)) == "1970-01-02T01:01:01Z");
}

TEST_CASE("TimingTracker measures elapsed time") {
    TimingTracker timer;
    REQUIRE(timer.elapsed().count() == 0);
    timer.start();
    REQUIRE(timer.running());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    timer.stop();
    REQUIRE_FALSE(timer.running());
    REQUIRE(timer.elapsed().count() >= 20);
    REQUIRE(timer.end_time() >= timer.start_time());
    auto frozen = timer.elapsed();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    REQUIRE(timer.elapsed() == frozen);
}
