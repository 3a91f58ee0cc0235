#include "lock_utils.hpp"
#include <atomic>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/file.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include "logger.hpp"

namespace syncguard {

namespace {

std::error_code last_error() { return std::error_code(errno, std::generic_category()); }

std::string pid_string() { return std::to_string(static_cast<long>(getpid())); }

// Distinguishes staging and reclaim names created by the same process.
std::atomic<unsigned> g_name_counter{0};

std::string unique_suffix() {
    return pid_string() + "-" + std::to_string(g_name_counter.fetch_add(1));
}

// State read by the signal handler. Only async-signal-safe calls are made on
// it, so the paths are kept in fixed buffers.
char g_sig_pid_file[PATH_MAX];
char g_sig_lock_dir[PATH_MAX];
volatile std::sig_atomic_t g_sig_armed = 0;

constexpr int kCleanupSignals[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};
void (*g_prev_handlers[sizeof(kCleanupSignals) / sizeof(kCleanupSignals[0])])(int);

extern "C" void release_lock_on_signal(int sig) {
    if (g_sig_armed) {
        g_sig_armed = 0;
        unlink(g_sig_pid_file);
        rmdir(g_sig_lock_dir);
    }
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

bool arm_signal_cleanup(const std::filesystem::path& dir, const std::filesystem::path& pid) {
    if (g_sig_armed)
        return false;
    const std::string d = dir.string();
    const std::string p = pid.string();
    if (d.size() >= sizeof(g_sig_lock_dir) || p.size() >= sizeof(g_sig_pid_file))
        return false;
    std::memcpy(g_sig_lock_dir, d.c_str(), d.size() + 1);
    std::memcpy(g_sig_pid_file, p.c_str(), p.size() + 1);
    g_sig_armed = 1;
    for (size_t i = 0; i < sizeof(kCleanupSignals) / sizeof(kCleanupSignals[0]); ++i)
        g_prev_handlers[i] = std::signal(kCleanupSignals[i], release_lock_on_signal);
    return true;
}

void disarm_signal_cleanup() {
    if (!g_sig_armed)
        return;
    g_sig_armed = 0;
    for (size_t i = 0; i < sizeof(kCleanupSignals) / sizeof(kCleanupSignals[0]); ++i) {
        auto prev = g_prev_handlers[i] == SIG_ERR ? SIG_DFL : g_prev_handlers[i];
        std::signal(kCleanupSignals[i], prev);
    }
}

bool write_pid_file(const std::filesystem::path& path) {
    UniqueFd fd(open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
    if (!fd)
        return false;
    std::string pid = pid_string() + "\n";
    return write_all(fd.get(), pid.data(), pid.size());
}

void remove_staging(const std::filesystem::path& staging) {
    std::error_code ec;
    std::filesystem::remove_all(staging, ec);
    if (ec)
        log_warning("Failed to remove lock staging directory",
                    {{"path", staging.string()}, {"error", ec.message()}});
}

// Removes `<lock>.stage-<pid>-<n>` directories whose creator has died
// between mkdir and rename.
void sweep_stale_staging(const std::filesystem::path& lock_path) {
    namespace fs = std::filesystem;
    fs::path parent = lock_path.parent_path();
    if (parent.empty())
        parent = ".";
    const std::string prefix = lock_path.filename().string() + ".stage-";
    std::error_code ec;
    fs::directory_iterator it(parent, ec);
    if (ec)
        return;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec)
            return;
        std::string name = it->path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0)
            continue;
        const char* start = name.c_str() + prefix.size();
        char* end = nullptr;
        errno = 0;
        long pid = std::strtol(start, &end, 10);
        if (errno != 0 || end == start || *end != '-' || pid <= 0)
            continue;
        if (pid == static_cast<long>(getpid()) || process_running(pid))
            continue;
        log_debug("Removing abandoned lock staging directory", {{"path", it->path().string()}});
        remove_staging(it->path());
    }
}

} // namespace

long read_lock_pid(const std::filesystem::path& path) {
    std::filesystem::path file = path;
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec))
        file = path / "pid";
    std::ifstream f(file);
    if (!f.is_open())
        return -1;
    long pid = -1;
    if (!(f >> pid))
        return -1;
    return pid;
}

const char* lock_kind_name(LockKind kind) {
    switch (kind) {
    case LockKind::ADVISORY_FILE:
        return "flock";
    case LockKind::ATOMIC_DIR:
        return "dir";
    }
    return "flock";
}

std::unique_ptr<Lock> make_lock(LockKind kind, const std::filesystem::path& path,
                                std::chrono::milliseconds retry_delay) {
    if (kind == LockKind::ATOMIC_DIR)
        return std::make_unique<DirectoryLock>(path, retry_delay);
    return std::make_unique<FileRegionLock>(path, retry_delay);
}

// ---------------------------------------------------------------------------
// FileRegionLock

FileRegionLock::FileRegionLock(std::filesystem::path path, std::chrono::milliseconds retry_delay)
    : Lock(std::move(path)), retry_delay_(retry_delay) {}

FileRegionLock::~FileRegionLock() { release(); }

UniqueFd FileRegionLock::open_lock_file() const {
    return UniqueFd(open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666));
}

void FileRegionLock::record_owner() {
    std::string pid = pid_string() + "\n";
    if (ftruncate(fd_.get(), 0) != 0 || lseek(fd_.get(), 0, SEEK_SET) != 0 ||
        !write_all(fd_.get(), pid.data(), pid.size())) {
        log_debug("Could not record lock owner",
                  {{"path", path_.string()}, {"error", last_error().message()}});
    }
}

bool FileRegionLock::try_acquire() {
    if (fd_)
        return true;
    UniqueFd fd = open_lock_file();
    if (!fd) {
        auto ec = last_error();
        throw LockError("Cannot open lock file " + path_.string() + ": " + ec.message(), ec);
    }
    while (flock(fd.get(), LOCK_EX | LOCK_NB) != 0) {
        if (errno == EINTR)
            continue;
        if (errno == EWOULDBLOCK)
            return false;
        auto ec = last_error();
        throw LockError("Cannot lock " + path_.string() + ": " + ec.message(), ec);
    }
    fd_ = std::move(fd);
    record_owner();
    return true;
}

void FileRegionLock::acquire() {
    if (fd_)
        return;
    bool warned = false;
    while (true) {
        UniqueFd fd = open_lock_file();
        int rc = -1;
        if (fd) {
            do {
                rc = flock(fd.get(), LOCK_EX);
            } while (rc != 0 && errno == EINTR);
        }
        if (rc == 0) {
            fd_ = std::move(fd);
            record_owner();
            return;
        }
        if (!warned) {
            log_warning("Lock file unavailable, retrying",
                        {{"path", path_.string()}, {"error", last_error().message()}});
            warned = true;
        }
        std::this_thread::sleep_for(retry_delay_);
    }
}

void FileRegionLock::release() noexcept {
    if (!fd_)
        return;
    flock(fd_.get(), LOCK_UN);
    fd_.reset();
}

// ---------------------------------------------------------------------------
// DirectoryLock

DirectoryLock::DirectoryLock(std::filesystem::path path, std::chrono::milliseconds retry_delay)
    : Lock(std::move(path)), retry_delay_(retry_delay) {}

DirectoryLock::~DirectoryLock() { release(); }

bool DirectoryLock::attempt() {
    namespace fs = std::filesystem;
    sweep_stale_staging(path_);
    fs::path staging = path_;
    staging += ".stage-" + unique_suffix();
    if (mkdir(staging.c_str(), 0755) != 0) {
        auto ec = last_error();
        throw LockError("Cannot create lock directory next to " + path_.string() + ": " +
                            ec.message(),
                        ec);
    }
    if (!write_pid_file(staging / "pid")) {
        auto ec = last_error();
        remove_staging(staging);
        throw LockError("Cannot write lock owner for " + path_.string() + ": " + ec.message(),
                        ec);
    }
    for (int round = 0; round < 2; ++round) {
        if (rename(staging.c_str(), path_.c_str()) == 0) {
            held_ = true;
            arm_signal_cleanup(path_, pid_file());
            return true;
        }
        int err = errno;
        if (err != EEXIST && err != ENOTEMPTY) {
            auto ec = std::error_code(err, std::generic_category());
            remove_staging(staging);
            throw LockError("Cannot acquire lock " + path_.string() + ": " + ec.message(), ec);
        }
        if (round > 0 || !reclaim_stale())
            break;
    }
    remove_staging(staging);
    return false;
}

// Called when the lock directory is populated. Returns true when the stale
// owner record was removed and the directory may now be empty.
bool DirectoryLock::reclaim_stale() {
    namespace fs = std::filesystem;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(path_, ec)) {
        // Leftover of a reclaimer that died before finishing.
        const std::string name = entry.path().filename().string();
        if (name.rfind("pid.stale-", 0) == 0) {
            long reclaimer = std::strtol(name.c_str() + 10, nullptr, 10);
            if (!process_running(reclaimer))
                fs::remove(entry.path(), ec);
        }
    }
    long owner = read_lock_pid(pid_file());
    if (owner >= 0 && process_running(owner))
        return false;
    // Owner records are complete before the rename, so an unreadable one is
    // corrupt rather than in progress.
    if (owner < 0 && !fs::exists(pid_file(), ec))
        return false;

    fs::path claimed = path_ / ("pid.stale-" + unique_suffix());
    if (rename(pid_file().c_str(), claimed.c_str()) != 0)
        return false;
    long claimed_owner = read_lock_pid(claimed);
    if (claimed_owner != owner && process_running(claimed_owner)) {
        // A live holder replaced the stale record between the read and the rename.
        if (rename(claimed.c_str(), pid_file().c_str()) != 0)
            log_error("Failed to restore lock owner record",
                      {{"path", path_.string()}, {"error", last_error().message()}});
        return false;
    }
    fs::remove(claimed, ec);
    log_warning("Reclaimed stale lock",
                {{"path", path_.string()}, {"stale_pid", std::to_string(owner)}});
    return true;
}

bool DirectoryLock::try_acquire() {
    if (held_)
        return true;
    return attempt();
}

void DirectoryLock::acquire() {
    if (held_)
        return;
    bool warned = false;
    while (true) {
        try {
            if (attempt())
                return;
        } catch (const LockError& e) {
            if (!warned) {
                log_warning(std::string("Lock directory unavailable, retrying: ") + e.what());
                warned = true;
            }
        }
        std::this_thread::sleep_for(retry_delay_);
    }
}

void DirectoryLock::release() noexcept {
    if (!held_)
        return;
    held_ = false;
    disarm_signal_cleanup();
    std::error_code ec;
    std::filesystem::remove(pid_file(), ec);
    std::filesystem::remove(path_, ec);
    if (ec)
        log_warning("Failed to remove lock directory",
                    {{"path", path_.string()}, {"error", ec.message()}});
}

// ---------------------------------------------------------------------------
// LockGuard

LockGuard::LockGuard(Lock& lock, LockMode mode) : lock_(lock) {
    if (mode == LockMode::BLOCKING) {
        lock_.acquire();
        return;
    }
    if (!lock_.try_acquire())
        throw LockError("Lock " + lock_.path().string() + " is held by another process",
                        std::make_error_code(std::errc::resource_unavailable_try_again));
}

LockGuard::~LockGuard() { lock_.release(); }

} // namespace syncguard
