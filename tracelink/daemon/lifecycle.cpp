// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>
#include <future>
#include <thread>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <tt-logger/tt-logger.hpp>

#include <tracelink/common/assert.hpp>
#include <tracelink/common/cleanup.hpp>
#include <tracelink/daemon/announcer.hpp>
#include <tracelink/daemon/lifecycle.hpp>
#include <tracelink/daemon/singleton_guard.hpp>
#include <tracelink/relay/ipc_listener.hpp>
#include <tracelink/relay/relay_queue.hpp>
#include <tracelink/sink/consumer.hpp>

namespace tracelink {

namespace {

// Shared with the reporter thread, which may outlive run() when the shutdown deadline passes.
struct PipelineOutcome {
    std::promise<void> finished;
    std::atomic<bool> failed = false;
};

void remove_socket_file(const std::filesystem::path& socket_path) {
    if (unlink(socket_path.c_str()) == 0) {
        log_info(tt::LogAlways, "[Lifecycle] Removed socket {}", socket_path.string());
        return;
    }
    int error = errno;
    if (error == ENOENT) {
        log_warning(tt::LogAlways, "[Lifecycle] Socket {} was never created, nothing to remove", socket_path.string());
    } else {
        log_warning(
            tt::LogAlways, "[Lifecycle] Failed to remove socket {} (errno={})", socket_path.string(), error);
    }
}

void run_reporter(
    const std::shared_ptr<Reporter>& reporter,
    std::shared_ptr<RelayQueue<CollectItem>> queue,
    ShutdownLatch& latch,
    PipelineOutcome& outcome) {
    RelayConsumer consumer(std::move(queue));
    try {
        reporter->run(consumer);
        log_info(tt::LogAlways, "[Reporter] Reporter finished");
        latch.trigger(ShutdownCause::PipelineCompleted);
    } catch (const ReporterError& e) {
        log_error(tt::LogAlways, "[Reporter] Fatal reporter error: {}", e.what());
        outcome.failed = true;
        latch.trigger(ShutdownCause::PipelineFailed);
    } catch (const std::exception& e) {
        log_critical(tt::LogAlways, "[Reporter] Unexpected exception in reporter: {}", e.what());
        outcome.failed = true;
        latch.trigger(ShutdownCause::PipelineFailed);
    }
    outcome.finished.set_value();
}

}  // namespace

std::string_view to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::Starting: return "Starting";
        case LifecycleState::Running: return "Running";
        case LifecycleState::ShuttingDown: return "ShuttingDown";
        case LifecycleState::Stopped: return "Stopped";
    }
    return "Unknown";
}

std::string_view to_string(ShutdownCause cause) {
    switch (cause) {
        case ShutdownCause::Signal: return "Signal";
        case ShutdownCause::Requested: return "Requested";
        case ShutdownCause::PipelineCompleted: return "PipelineCompleted";
        case ShutdownCause::PipelineFailed: return "PipelineFailed";
    }
    return "Unknown";
}

bool ShutdownLatch::trigger(ShutdownCause cause) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cause_.has_value()) {
            return false;
        }
        cause_ = cause;
    }
    triggered_.notify_all();
    return true;
}

ShutdownCause ShutdownLatch::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    triggered_.wait(lock, [this] { return cause_.has_value(); });
    return *cause_;
}

std::optional<ShutdownCause> ShutdownLatch::cause() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cause_;
}

Daemon::Daemon(DaemonConfig config, std::shared_ptr<Reporter> reporter) :
    config_(std::move(config)), reporter_(std::move(reporter)), latch_(std::make_shared<ShutdownLatch>()) {
    TL_FATAL(reporter_ != nullptr, "Daemon requires a reporter");
}

void Daemon::set_state(LifecycleState state) {
    LifecycleState previous = state_.exchange(state);
    log_info(tt::LogAlways, "[Lifecycle] {} -> {}", to_string(previous), to_string(state));
}

void Daemon::request_shutdown() {
    if (latch_->trigger(ShutdownCause::Requested)) {
        log_info(tt::LogAlways, "[Lifecycle] Shutdown requested");
    }
}

int Daemon::run() {
    TL_FATAL(!started_.exchange(true), "Daemon::run() may only be called once");
    log_info(
        tt::LogAlways,
        "[Lifecycle] Starting {} instance {} (pid {})",
        config_.service_name,
        config_.service_instance,
        getpid());

    AcquireResult acquired = SingletonGuard::acquire(config_.lock_path);
    if (acquired.status != AcquireStatus::Locked) {
        log_error(
            tt::LogAlways,
            "[Lifecycle] Could not acquire {} ({}), exiting",
            config_.lock_path.string(),
            to_string(acquired.status));
        set_state(LifecycleState::Stopped);
        return 1;
    }

    int exit_code = 1;
    try {
        exit_code = run_locked();
    } catch (const std::exception& e) {
        log_critical(tt::LogAlways, "[Lifecycle] Daemon failed: {}", e.what());
        exit_code = 1;
    }
    set_state(LifecycleState::Stopped);
    log_info(tt::LogAlways, "[Lifecycle] Exiting with status {}", exit_code);
    return exit_code;
}

int Daemon::run_locked() {
    auto queue = std::make_shared<RelayQueue<CollectItem>>(config_.queue_capacity);
    boost::asio::thread_pool pool(config_.resolved_worker_threads());

    // Runs on every exit from here on, after the listener is released.
    auto remove_socket = make_scope_exit([this]() { remove_socket_file(config_.socket_path); });

    boost::asio::signal_set signals(pool.get_executor());
    boost::system::error_code ec;
    signals.add(SIGTERM, ec);
    if (!ec) {
        signals.add(SIGINT, ec);
    }
    if (ec) {
        TL_THROW("Failed to register signal handlers: {}", ec.message());
    }
    signals.async_wait([latch = latch_](const boost::system::error_code& wait_ec, int signal_number) {
        if (wait_ec) {
            return;
        }
        log_info(tt::LogAlways, "[Lifecycle] Received {}", strsignal(signal_number));
        latch->trigger(ShutdownCause::Signal);
    });

    auto listener = IpcListener::bind(pool.get_executor(), config_.socket_path, config_.max_frame_size, *queue);
    listener->start();
    auto announcer = std::make_shared<Announcer>(pool.get_executor(), config_, *queue);
    announcer->start();

    auto outcome = std::make_shared<PipelineOutcome>();
    std::future<void> reporter_finished = outcome->finished.get_future();
    set_state(LifecycleState::Running);
    std::thread reporter_thread([reporter = reporter_, queue, latch = latch_, outcome]() {
        run_reporter(reporter, queue, *latch, *outcome);
    });

    ShutdownCause cause = latch_->wait();
    set_state(LifecycleState::ShuttingDown);
    log_info(tt::LogAlways, "[Lifecycle] Shutting down: {}", to_string(cause));

    listener->stop();
    announcer->stop();
    signals.cancel(ec);
    queue->close();

    if (reporter_finished.wait_for(config_.shutdown_timeout) == std::future_status::ready) {
        reporter_thread.join();
    } else {
        log_warning(
            tt::LogAlways,
            "[Lifecycle] Reporter did not finish within {} ms, abandoning final flush",
            config_.shutdown_timeout.count());
        reporter_thread.detach();
    }

    pool.stop();
    pool.join();

    RelayStats stats = queue->stats();
    log_info(
        tt::LogAlways,
        "[Lifecycle] Relayed {} items, dropped {}, delivered {}, {} left undelivered, {} connections served",
        stats.enqueued,
        stats.dropped,
        stats.delivered,
        queue->size(),
        listener->connections_accepted());

    return (cause == ShutdownCause::PipelineFailed || outcome->failed.load()) ? 1 : 0;
}

}  // namespace tracelink
