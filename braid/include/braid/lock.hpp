#pragma once
// Lock: advisory exclusive flock shared by all worktrees of a repository
//
// Held for the whole of a mutation; released when the guard dies.
// The lock file is created on demand and never truncated.

#include "error.hpp"
#include "fileio.hpp"
#include "log.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <optional>
#include <utility>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace braid {

namespace fs = std::filesystem;

class LockGuard {
public:
    // Block until the exclusive lock is held
    static Result<LockGuard> acquire(const fs::path& lock_path) {
        auto fd = open_lock_file(lock_path);
        if (!fd) return fd.error();

        int rc;
        do {
            rc = ::flock(*fd, LOCK_EX);
        } while (rc != 0 && errno == EINTR);

        if (rc != 0) {
            int saved = errno;
            ::close(*fd);
            return Error::io("cannot lock " + lock_path.string() + ": " + strerror(saved));
        }
        log::debug("lock", "acquired %s", lock_path.c_str());
        return LockGuard(*fd, lock_path);
    }

    // Non-blocking: nullopt when another process holds the lock
    static Result<std::optional<LockGuard>> try_acquire(const fs::path& lock_path) {
        auto fd = open_lock_file(lock_path);
        if (!fd) return fd.error();

        if (::flock(*fd, LOCK_EX | LOCK_NB) != 0) {
            int saved = errno;
            ::close(*fd);
            if (saved == EWOULDBLOCK) {
                log::debug("lock", "held elsewhere %s", lock_path.c_str());
                return std::optional<LockGuard>{};
            }
            return Error::io("cannot lock " + lock_path.string() + ": " + strerror(saved));
        }
        log::debug("lock", "acquired (try) %s", lock_path.c_str());
        return std::optional<LockGuard>{LockGuard(*fd, lock_path)};
    }

    ~LockGuard() { release(); }

    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

    LockGuard(LockGuard&& other) noexcept
        : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

    LockGuard& operator=(LockGuard&& other) noexcept {
        if (this != &other) {
            release();
            fd_ = std::exchange(other.fd_, -1);
            path_ = std::move(other.path_);
        }
        return *this;
    }

    bool held() const { return fd_ >= 0; }

private:
    LockGuard(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}

    static Result<int> open_lock_file(const fs::path& lock_path) {
        auto dir = ensure_dir(lock_path.parent_path());
        if (!dir) return dir.error();

        int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            return Error::io("cannot open " + lock_path.string() + ": " + strerror(errno));
        }
        return fd;
    }

    void release() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
            log::debug("lock", "released %s", path_.c_str());
            fd_ = -1;
        }
    }

    int fd_ = -1;
    fs::path path_;
};

} // namespace braid
