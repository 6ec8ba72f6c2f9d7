// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <exception>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <tt-logger/tt-logger.hpp>

#include <tracelink/daemon/announcer.hpp>
#include <tracelink/daemon/instance_properties.hpp>

namespace tracelink {

Announcer::Announcer(
    const boost::asio::any_io_executor& executor, const DaemonConfig& config, RelayQueue<CollectItem>& queue) :
    strand_(boost::asio::make_strand(executor)), timer_(strand_), config_(config), queue_(queue) {}

void Announcer::start() {
    boost::asio::post(strand_, [self = shared_from_this()]() {
        log_info(
            tt::LogAlways,
            "[Announcer] Started: every {} ms, properties every {} ticks",
            self->config_.heartbeat_period.count(),
            self->config_.properties_report_period_factor);
        self->next_deadline_ = std::chrono::steady_clock::now();
        self->tick();
    });
}

void Announcer::stop() {
    boost::asio::post(strand_, [self = shared_from_this()]() {
        self->stopped_ = true;
        self->timer_.cancel();
    });
}

void Announcer::tick() {
    if (stopped_) {
        return;
    }
    uint64_t tick_index = ticks_++;
    if (!emit(tick_index)) {
        log_debug(tt::LogAlways, "[Announcer] Queue closed, stopping after {} ticks", tick_index + 1);
        stopped_ = true;
        return;
    }
    schedule_next();
}

void Announcer::schedule_next() {
    next_deadline_ += config_.heartbeat_period;
    timer_.expires_at(next_deadline_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            log_error(tt::LogAlways, "[Announcer] Timer failed: {}", ec.message());
            return;
        }
        self->tick();
    });
}

bool Announcer::emit(uint64_t tick_index) {
    CollectItem event;
    try {
        if (tick_index % config_.properties_report_period_factor == 0) {
            event = build_instance_properties(config_);
        } else {
            event = build_instance_ping(config_);
        }
    } catch (const std::exception& e) {
        log_error(tt::LogAlways, "[Announcer] Failed to build event for tick {}: {}", tick_index, e.what());
        return true;
    }

    std::string_view kind = item_kind(event);
    switch (queue_.try_enqueue(std::move(event))) {
        case EnqueueResult::Enqueued: return true;
        case EnqueueResult::Dropped:
            log_warning(
                tt::LogAlways,
                "[Relay] Queue full ({} items), dropped {} event from announcer ({} dropped so far)",
                queue_.capacity(),
                kind,
                queue_.stats().dropped);
            return true;
        case EnqueueResult::ChannelClosed: return false;
    }
    return false;
}

}  // namespace tracelink
