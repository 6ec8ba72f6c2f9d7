// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include <tracelink/daemon/config.hpp>
#include <tracelink/sink/reporter.hpp>

namespace tracelink {

enum class LifecycleState {
    Starting,
    Running,
    ShuttingDown,
    Stopped,
};

std::string_view to_string(LifecycleState state);

enum class ShutdownCause {
    Signal,             // SIGTERM or SIGINT
    Requested,          // Daemon::request_shutdown()
    PipelineCompleted,  // reporter returned on its own
    PipelineFailed,     // reporter threw
};

std::string_view to_string(ShutdownCause cause);

// One-shot race between everything that can end the daemon. The first trigger() wins; later ones are ignored.
class ShutdownLatch {
public:
    // Returns true if this call decided the cause.
    bool trigger(ShutdownCause cause);
    ShutdownCause wait();
    std::optional<ShutdownCause> cause() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable triggered_;
    std::optional<ShutdownCause> cause_;
};

// Lifecycle coordinator. run() takes the singleton lock, binds the IPC socket, starts the listener, the announcer
// and the reporter, then blocks until a termination signal, request_shutdown() or the end of the reporter, and
// tears everything down. The socket file is removed on every path out of run() once the lock is held.
//
//   Starting -> Running -> ShuttingDown -> Stopped
//
// Exit status: 0 for a signal, a request or a reporter that returned; 1 for a reporter failure or a startup failure
// (lock held elsewhere, bind error).
class Daemon {
public:
    Daemon(DaemonConfig config, std::shared_ptr<Reporter> reporter);

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    // May be called once.
    int run();

    // Thread-safe. Ends a running daemon as if it had been signalled; before run() it makes run() stop right after
    // startup.
    void request_shutdown();

    LifecycleState state() const { return state_.load(); }
    const DaemonConfig& config() const { return config_; }

private:
    int run_locked();
    void set_state(LifecycleState state);

    const DaemonConfig config_;
    std::shared_ptr<Reporter> reporter_;
    std::shared_ptr<ShutdownLatch> latch_;
    std::atomic<LifecycleState> state_ = LifecycleState::Starting;
    std::atomic<bool> started_ = false;
};

}  // namespace tracelink
