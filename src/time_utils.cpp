#include "time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

std::string format_duration_hms(std::chrono::milliseconds dur) {
    long long total = std::chrono::duration_cast<std::chrono::seconds>(dur).count();
    if (total < 0)
        total = 0;
    long long s = total % 60;
    long long m = (total / 60) % 60;
    long long h = total / 3600;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", h, m, s);
    return std::string(buf);
}

void TimingTracker::start() {
    wall_start_ = std::chrono::system_clock::now();
    mono_start_ = std::chrono::steady_clock::now();
    wall_end_ = wall_start_;
    mono_end_ = mono_start_;
    started_ = true;
    stopped_ = false;
}

void TimingTracker::stop() {
    if (!started_ || stopped_)
        return;
    wall_end_ = std::chrono::system_clock::now();
    mono_end_ = std::chrono::steady_clock::now();
    stopped_ = true;
}

std::chrono::milliseconds TimingTracker::elapsed() const {
    if (!started_)
        return std::chrono::milliseconds(0);
    auto end = stopped_ ? mono_end_ : std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - mono_start_);
}
