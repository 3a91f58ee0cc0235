#ifndef INVOCATION_HPP
#define INVOCATION_HPP
#include <chrono>
#include <string>
#include <vector>

namespace syncguard {

/**
 * @brief Generate a token identifying one run of the wrapper.
 *
 * Format: `<nanoseconds since epoch>-<pid>-<32 random bits>`. Collisions are
 * treated as negligible and never checked.
 */
std::string make_invocation_id();

/**
 * @brief One execution of the wrapper.
 *
 * The request fields are fixed at construction. Exit status, output and the
 * timing fields are filled once by record_result() after the transfer ends.
 */
struct Invocation {
    std::string id;
    std::string source;
    std::string destination;
    std::vector<std::string> options;

    std::chrono::system_clock::time_point start_time{};
    std::chrono::system_clock::time_point end_time{};
    std::chrono::milliseconds duration{0};
    int exit_status = 0;
    std::string output;
    bool completed = false;

    /** Store the transfer outcome. Later calls are ignored. */
    void record_result(int status, std::string text, std::chrono::system_clock::time_point start,
                       std::chrono::system_clock::time_point end,
                       std::chrono::milliseconds elapsed);

    /** Options joined by single spaces, as a shell would print "$*". */
    std::string options_string() const;
};

} // namespace syncguard

#endif // INVOCATION_HPP
