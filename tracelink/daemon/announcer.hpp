// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <tracelink/daemon/config.hpp>
#include <tracelink/relay/collect_item.hpp>
#include <tracelink/relay/relay_queue.hpp>

namespace tracelink {

// Keeps the daemon visible to the backend regardless of telemetry volume. Every heartbeat_period it pushes one event
// through the relay queue: a freshly built InstanceProperties report on ticks 0, factor, 2*factor, ... and an
// InstancePing on every other tick. The first tick fires immediately; later ticks are scheduled at a fixed rate.
//
// `config` and `queue` must outlive every handler the announcer posts.
class Announcer : public std::enable_shared_from_this<Announcer> {
public:
    Announcer(const boost::asio::any_io_executor& executor, const DaemonConfig& config, RelayQueue<CollectItem>& queue);

    void start();
    void stop();

    uint64_t ticks() const { return ticks_.load(); }

private:
    void tick();
    void schedule_next();
    // Returns false when the queue is closed.
    bool emit(uint64_t tick_index);

    boost::asio::strand<boost::asio::any_io_executor> strand_;
    boost::asio::steady_timer timer_;
    const DaemonConfig& config_;
    RelayQueue<CollectItem>& queue_;
    std::chrono::steady_clock::time_point next_deadline_;
    bool stopped_ = false;
    std::atomic<uint64_t> ticks_ = 0;
};

}  // namespace tracelink
