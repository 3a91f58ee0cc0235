#include "system_utils.hpp"
#include <cerrno>
#include <signal.h>
#include <sys/types.h>

namespace syncguard {

bool write_all(int fd, const char* data, std::size_t len) {
    while (len > 0) {
        ssize_t w = ::write(fd, data, len);
        if (w < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        data += w;
        len -= static_cast<std::size_t>(w);
    }
    return true;
}

bool process_running(long pid) {
    if (pid <= 0)
        return false;
    if (kill(static_cast<pid_t>(pid), 0) == 0)
        return true;
    return errno != ESRCH;
}

} // namespace syncguard
