#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <cstddef>
#include <string>
#include <unistd.h>

namespace syncguard {

/**
 * @brief Write the whole buffer to @p fd, retrying on short writes and EINTR.
 *
 * @return true when every byte was written; false with errno set otherwise.
 */
bool write_all(int fd, const char* data, std::size_t len);

/**
 * @brief Check whether a process with the given PID is currently running.
 *
 * A PID owned by another user still counts as running.
 */
bool process_running(long pid);

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Use to manage
 * ownership of file descriptors returned by open and similar system calls.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

} // namespace syncguard

#endif // SYSTEM_UTILS_HPP
