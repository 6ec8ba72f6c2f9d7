// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <tt-logger/tt-logger.hpp>

#include <tracelink/common/assert.hpp>
#include <tracelink/relay/connection.hpp>
#include <tracelink/relay/ipc_listener.hpp>

namespace tracelink {

namespace {

void remove_stale_socket(const std::filesystem::path& socket_path) {
    if (unlink(socket_path.c_str()) == 0) {
        log_info(tt::LogAlways, "[IPC] Removed stale UNIX socket: {}", socket_path.string());
        return;
    }
    int error = errno;
    if (error != ENOENT) {
        log_warning(
            tt::LogAlways,
            "[IPC] Failed to unlink socket {} (errno={}). This may indicate a permission issue from a previous "
            "run with elevated privileges. The bind may fail.",
            socket_path.string(),
            error);
    }
}

}  // namespace

IpcListener::IpcListener(
    const boost::asio::any_io_executor& executor,
    std::filesystem::path socket_path,
    std::size_t max_frame_size,
    RelayQueue<CollectItem>& queue) :
    executor_(executor),
    strand_(boost::asio::make_strand(executor)),
    acceptor_(strand_),
    retry_timer_(strand_),
    socket_path_(std::move(socket_path)),
    max_frame_size_(max_frame_size),
    queue_(queue) {}

std::shared_ptr<IpcListener> IpcListener::bind(
    const boost::asio::any_io_executor& executor,
    const std::filesystem::path& socket_path,
    std::size_t max_frame_size,
    RelayQueue<CollectItem>& queue) {
    remove_stale_socket(socket_path);

    auto listener = std::make_shared<IpcListener>(executor, socket_path, max_frame_size, queue);
    boost::asio::local::stream_protocol::endpoint endpoint(socket_path.string());
    boost::system::error_code ec;
    listener->acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        listener->acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        listener->acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        TL_THROW("Failed to bind IPC socket {}: {}", socket_path.string(), ec.message());
    }

    // Producers run under arbitrary users.
    if (chmod(socket_path.c_str(), 0666) != 0) {
        int error = errno;
        log_warning(
            tt::LogAlways,
            "[IPC] Failed to set permissions on socket {} (errno={}). Producers may not be able to connect.",
            socket_path.string(),
            error);
    }

    log_info(tt::LogAlways, "[IPC] Listening on {}", socket_path.string());
    return listener;
}

void IpcListener::start() {
    boost::asio::post(strand_, [self = shared_from_this()]() { self->accept_next(); });
}

void IpcListener::stop() {
    boost::asio::post(strand_, [self = shared_from_this()]() {
        if (self->stopped_) {
            return;
        }
        self->stopped_ = true;
        boost::system::error_code ec;
        self->acceptor_.close(ec);
        if (ec) {
            log_warning(tt::LogAlways, "[IPC] Closing acceptor failed: {}", ec.message());
        }
        self->retry_timer_.cancel();
        log_info(
            tt::LogAlways, "[IPC] Listener stopped after {} connections", self->connections_accepted_.load());
    });
}

void IpcListener::accept_next() {
    if (stopped_) {
        return;
    }
    acceptor_.async_accept(
        executor_,
        [self = shared_from_this()](
            const boost::system::error_code& ec, boost::asio::local::stream_protocol::socket socket) {
            self->on_accept(ec, std::move(socket));
        });
}

void IpcListener::on_accept(const boost::system::error_code& ec, boost::asio::local::stream_protocol::socket socket) {
    if (stopped_) {
        return;
    }
    if (ec) {
        uint64_t failures = ++accept_failures_;
        log_error(tt::LogAlways, "[IPC] Accept failed ({} so far): {}", failures, ec.message());
        retry_timer_.expires_after(kAcceptRetryDelay);
        retry_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& wait_ec) {
            if (wait_ec != boost::asio::error::operation_aborted) {
                self->accept_next();
            }
        });
        return;
    }

    uint64_t id = ++connections_accepted_;
    log_debug(tt::LogAlways, "[IPC] Accepted connection {}", id);
    std::make_shared<Connection>(std::make_unique<SocketFrameSource>(std::move(socket), max_frame_size_), id, queue_)
        ->start();
    accept_next();
}

}  // namespace tracelink
