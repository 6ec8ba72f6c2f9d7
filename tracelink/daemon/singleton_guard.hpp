// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace tracelink {

enum class AcquireStatus {
    Locked,
    AlreadyRunning,
    IoError,
};

constexpr std::string_view to_string(AcquireStatus status) {
    switch (status) {
        case AcquireStatus::Locked: return "Locked";
        case AcquireStatus::AlreadyRunning: return "AlreadyRunning";
        case AcquireStatus::IoError: return "IoError";
    }
    return "Unknown";
}

struct AcquireResult;

// Exclusive advisory lock on a pid file, held for as long as the guard lives. At most one daemon per lock path.
// The lock file is left in place on release; only the lock is dropped.
class SingletonGuard {
public:
    // Creates the lock file's parent directory if needed, then tries to take the lock without blocking.
    // The current pid is written to the file only once the lock is held, so a running daemon's file is never
    // touched by a second instance.
    static AcquireResult acquire(const std::filesystem::path& lock_path);

    ~SingletonGuard();

    SingletonGuard(SingletonGuard&& other) noexcept;
    SingletonGuard& operator=(SingletonGuard&& other) noexcept;
    SingletonGuard(const SingletonGuard&) = delete;
    SingletonGuard& operator=(const SingletonGuard&) = delete;

    const std::filesystem::path& lock_path() const { return lock_path_; }

private:
    SingletonGuard(int fd, std::filesystem::path lock_path);
    void release();

    int fd_ = -1;
    std::filesystem::path lock_path_;
};

struct AcquireResult {
    AcquireStatus status;
    std::optional<SingletonGuard> guard;  // set when status == Locked
    int error = 0;                        // errno, set when status == IoError
};

}  // namespace tracelink
