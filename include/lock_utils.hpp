#ifndef LOCK_UTILS_HPP
#define LOCK_UTILS_HPP
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include "system_utils.hpp"

namespace syncguard {

/// Which primitive backs a lock resource.
enum class LockKind {
    ADVISORY_FILE, ///< flock(2) on a fixed lock file
    ATOMIC_DIR     ///< atomically created lock directory
};

/// Whether acquisition waits for the holder or fails fast.
enum class LockMode { BLOCKING, NON_BLOCKING };

constexpr std::chrono::milliseconds kDefaultLockRetry{100};

/**
 * @brief Raised when a lock cannot be acquired in non-blocking mode or the
 *        lock resource itself is unusable.
 */
class LockError : public std::runtime_error {
  public:
    explicit LockError(const std::string& what, std::error_code ec = {})
        : std::runtime_error(what), code_(ec) {}
    const std::error_code& code() const noexcept { return code_; }

  private:
    std::error_code code_;
};

/**
 * @brief Host-local exclusive lock on a filesystem resource.
 *
 * Implementations are not reentrant: acquiring a lock that is already held
 * by the same object is a no-op.
 */
class Lock {
  public:
    explicit Lock(std::filesystem::path path) : path_(std::move(path)) {}
    virtual ~Lock() = default;
    Lock(const Lock&) = delete;
    Lock& operator=(const Lock&) = delete;

    /**
     * @brief Block until the lock is held.
     *
     * Retries indefinitely, including when the resource is not accessible.
     */
    virtual void acquire() = 0;

    /**
     * @brief Take the lock only if it is free right now.
     *
     * @return false when another process holds it.
     * @throws LockError when the resource cannot be used at all.
     */
    virtual bool try_acquire() = 0;

    /** Release the lock if held. Safe to call more than once. */
    virtual void release() noexcept = 0;

    virtual bool held() const noexcept = 0;

    const std::filesystem::path& path() const noexcept { return path_; }

  protected:
    std::filesystem::path path_;
};

/**
 * @brief Advisory lock taken with flock(2) on a lock file.
 *
 * The file is created on demand and never removed, since unlinking a lock
 * file would let a later opener lock a different inode. The kernel drops the
 * lock when the holder exits for any reason. The holder's PID is written to
 * the file for inspection.
 */
class FileRegionLock : public Lock {
  public:
    explicit FileRegionLock(std::filesystem::path path,
                            std::chrono::milliseconds retry_delay = kDefaultLockRetry);
    ~FileRegionLock() override;

    void acquire() override;
    bool try_acquire() override;
    void release() noexcept override;
    bool held() const noexcept override { return static_cast<bool>(fd_); }

  private:
    UniqueFd open_lock_file() const;
    void record_owner();

    std::chrono::milliseconds retry_delay_;
    UniqueFd fd_;
};

/**
 * @brief Mutex built on atomic directory creation.
 *
 * A staging directory holding a `pid` file is renamed onto the lock path.
 * rename(2) replaces a missing or empty directory but fails on a populated
 * one, so a lock directory left empty by a crashed holder is simply reused.
 * A lock whose recorded PID no longer runs is reclaimed. While held, fatal
 * signals (SIGINT, SIGTERM, SIGHUP, SIGQUIT) remove the lock before the
 * process terminates.
 */
class DirectoryLock : public Lock {
  public:
    explicit DirectoryLock(std::filesystem::path path,
                           std::chrono::milliseconds retry_delay = kDefaultLockRetry);
    ~DirectoryLock() override;

    void acquire() override;
    bool try_acquire() override;
    void release() noexcept override;
    bool held() const noexcept override { return held_; }

  private:
    std::filesystem::path pid_file() const { return path_ / "pid"; }
    bool attempt();
    bool reclaim_stale();

    std::chrono::milliseconds retry_delay_;
    bool held_ = false;
};

/**
 * @brief Read the PID stored in a lock file or lock directory.
 *
 * @return The PID, or -1 when it is missing or unreadable.
 */
long read_lock_pid(const std::filesystem::path& path);

/**
 * @brief Create the lock implementation selected by @p kind.
 */
std::unique_ptr<Lock> make_lock(LockKind kind, const std::filesystem::path& path,
                                std::chrono::milliseconds retry_delay = kDefaultLockRetry);

const char* lock_kind_name(LockKind kind);

/**
 * @brief RAII guard that holds a lock for its lifetime.
 *
 * The constructor acquires according to @p mode and the destructor releases,
 * so every exit path out of the critical section, including exceptions,
 * releases exactly once.
 *
 * @throws LockError in non-blocking mode when the lock is busy.
 */
class LockGuard {
  public:
    LockGuard(Lock& lock, LockMode mode);
    ~LockGuard();
    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

  private:
    Lock& lock_;
};

} // namespace syncguard

#endif // LOCK_UTILS_HPP
