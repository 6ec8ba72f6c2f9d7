// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <tt-logger/tt-logger.hpp>

#include <tracelink/common/overloaded.hpp>
#include <tracelink/relay/connection.hpp>

namespace tracelink {

Connection::Connection(std::unique_ptr<FrameSource> source, uint64_t id, RelayQueue<CollectItem>& queue) :
    source_(std::move(source)), queue_(queue), id_(id) {}

void Connection::start() {
    log_debug(tt::LogAlways, "[IPC] Connection {}: entering receive loop", id_);
    receive_next();
}

void Connection::receive_next() {
    source_->async_receive([self = shared_from_this()](ReceiveResult result) {
        if (self->handle(std::move(result))) {
            self->receive_next();
        }
    });
}

bool Connection::handle(ReceiveResult result) {
    return std::visit(
        overloaded{
            [this](CollectItem& item) {
                consecutive_transport_errors_ = 0;
                ++frames_received_;
                return forward(std::move(item));
            },
            [this](EndOfStream&) {
                log_debug(
                    tt::LogAlways, "[IPC] Connection {}: leaving receive loop after {} frames", id_, frames_received_);
                return false;
            },
            [this](DecodeError& error) {
                log_error(
                    tt::LogAlways,
                    "[IPC] Connection {}: receive failed ({}): {}",
                    id_,
                    to_string(error.kind),
                    error.message);
                if (error.kind != DecodeErrorKind::Transport) {
                    consecutive_transport_errors_ = 0;
                    return true;
                }
                if (++consecutive_transport_errors_ >= kMaxConsecutiveTransportErrors) {
                    log_error(
                        tt::LogAlways,
                        "[IPC] Connection {}: giving up after {} consecutive transport errors",
                        id_,
                        consecutive_transport_errors_);
                    return false;
                }
                return true;
            },
        },
        result);
}

bool Connection::forward(CollectItem item) {
    std::string_view kind = item_kind(item);
    switch (queue_.try_enqueue(std::move(item))) {
        case EnqueueResult::Enqueued: return true;
        case EnqueueResult::Dropped:
            // The producer is never made to wait; the item is lost.
            log_warning(
                tt::LogAlways,
                "[Relay] Queue full ({} items), dropped {} item from connection {} ({} dropped so far)",
                queue_.capacity(),
                kind,
                id_,
                queue_.stats().dropped);
            return true;
        case EnqueueResult::ChannelClosed:
            log_debug(tt::LogAlways, "[Relay] Queue closed, connection {} stops receiving", id_);
            return false;
    }
    return false;
}

}  // namespace tracelink
