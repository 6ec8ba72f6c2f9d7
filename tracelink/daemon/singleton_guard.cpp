// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <system_error>

#include <tt-logger/tt-logger.hpp>

#include <tracelink/daemon/singleton_guard.hpp>

namespace tracelink {

namespace {

bool write_pid(int fd) {
    std::string contents = std::to_string(getpid()) + "\n";
    if (ftruncate(fd, 0) != 0) {
        return false;
    }
    std::size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = pwrite(fd, contents.data() + written, contents.size() - written, static_cast<off_t>(written));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

}  // namespace

AcquireResult SingletonGuard::acquire(const std::filesystem::path& lock_path) {
    if (lock_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(lock_path.parent_path(), ec);
        if (ec) {
            log_error(
                tt::LogAlways,
                "[Singleton] Failed to create directory {}: {}",
                lock_path.parent_path().string(),
                ec.message());
            return AcquireResult{AcquireStatus::IoError, std::nullopt, ec.value()};
        }
    }

    int fd = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        int error = errno;
        log_error(tt::LogAlways, "[Singleton] Failed to open lock file {} (errno={})", lock_path.string(), error);
        return AcquireResult{AcquireStatus::IoError, std::nullopt, error};
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int error = errno;
        close(fd);
        if (error == EWOULDBLOCK) {
            log_error(
                tt::LogAlways, "[Singleton] Another instance holds {}, refusing to start", lock_path.string());
            return AcquireResult{AcquireStatus::AlreadyRunning, std::nullopt, 0};
        }
        log_error(tt::LogAlways, "[Singleton] Failed to lock {} (errno={})", lock_path.string(), error);
        return AcquireResult{AcquireStatus::IoError, std::nullopt, error};
    }

    if (!write_pid(fd)) {
        int error = errno;
        close(fd);
        log_error(tt::LogAlways, "[Singleton] Failed to write pid to {} (errno={})", lock_path.string(), error);
        return AcquireResult{AcquireStatus::IoError, std::nullopt, error};
    }

    log_info(tt::LogAlways, "[Singleton] Acquired {} (pid {})", lock_path.string(), getpid());
    return AcquireResult{AcquireStatus::Locked, SingletonGuard(fd, lock_path), 0};
}

SingletonGuard::SingletonGuard(int fd, std::filesystem::path lock_path) : fd_(fd), lock_path_(std::move(lock_path)) {}

SingletonGuard::~SingletonGuard() { release(); }

SingletonGuard::SingletonGuard(SingletonGuard&& other) noexcept :
    fd_(other.fd_), lock_path_(std::move(other.lock_path_)) {
    other.fd_ = -1;
}

SingletonGuard& SingletonGuard::operator=(SingletonGuard&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        lock_path_ = std::move(other.lock_path_);
        other.fd_ = -1;
    }
    return *this;
}

void SingletonGuard::release() {
    if (fd_ < 0) {
        return;
    }
    // Closing the descriptor drops the flock.
    close(fd_);
    fd_ = -1;
    log_debug(tt::LogAlways, "[Singleton] Released {}", lock_path_.string());
}

}  // namespace tracelink
