#include "invocation.hpp"
#include <cstdint>
#include <random>
#include <unistd.h>

namespace syncguard {

std::string make_invocation_id() {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    std::random_device rd;
    std::uint32_t rnd = rd();
    return std::to_string(ns) + "-" + std::to_string(static_cast<long>(getpid())) + "-" +
           std::to_string(rnd);
}

void Invocation::record_result(int status, std::string text,
                               std::chrono::system_clock::time_point start,
                               std::chrono::system_clock::time_point end,
                               std::chrono::milliseconds elapsed) {
    if (completed)
        return;
    exit_status = status;
    output = std::move(text);
    start_time = start;
    end_time = end;
    duration = elapsed;
    completed = true;
}

std::string Invocation::options_string() const {
    std::string out;
    for (size_t i = 0; i < options.size(); ++i) {
        if (i > 0)
            out += ' ';
        out += options[i];
    }
    return out;
}

} // namespace syncguard
