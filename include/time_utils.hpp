#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format a point in time as ISO-8601 UTC (YYYY-MM-DDTHH:MM:SSZ).
 */
std::string iso8601_utc(std::chrono::system_clock::time_point tp);

/**
 * @brief Format a duration as HH:MM:SS. Hours are not wrapped at 24.
 */
std::string format_duration_hms(std::chrono::milliseconds dur);

/**
 * @brief Wall-clock start/end recorder for one invocation.
 *
 * Start and end are captured from the system clock for reporting while the
 * elapsed time is measured on the steady clock so clock adjustments between
 * start() and stop() cannot produce a negative duration.
 */
class TimingTracker {
  public:
    void start();
    void stop();
    bool running() const { return started_ && !stopped_; }
    std::chrono::system_clock::time_point start_time() const { return wall_start_; }
    std::chrono::system_clock::time_point end_time() const { return wall_end_; }
    /** Elapsed time between start() and stop(), or until now while running. */
    std::chrono::milliseconds elapsed() const;

  private:
    bool started_ = false;
    bool stopped_ = false;
    std::chrono::system_clock::time_point wall_start_{};
    std::chrono::system_clock::time_point wall_end_{};
    std::chrono::steady_clock::time_point mono_start_{};
    std::chrono::steady_clock::time_point mono_end_{};
};

#endif // TIME_UTILS_HPP
