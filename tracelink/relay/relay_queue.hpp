// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include <tracelink/common/assert.hpp>

namespace tracelink {

// Outcome of a non-blocking enqueue. Dropped is the backpressure path (queue at capacity, item discarded);
// ChannelClosed means the consuming side is gone and the caller should stop producing.
enum class EnqueueResult {
    Enqueued,
    Dropped,
    ChannelClosed,
};

constexpr std::string_view to_string(EnqueueResult result) {
    switch (result) {
        case EnqueueResult::Enqueued: return "Enqueued";
        case EnqueueResult::Dropped: return "Dropped";
        case EnqueueResult::ChannelClosed: return "ChannelClosed";
    }
    return "Unknown";
}

struct RelayStats {
    uint64_t enqueued = 0;
    uint64_t dropped = 0;
    uint64_t delivered = 0;
};

// Fixed-capacity multi-producer / single-consumer queue between the per-connection decode loops and the
// upstream reporter.
//
// Storage is a ring of capacity + 1 slots: the queue is full when advancing the tail would land on the head,
// so head == tail always means empty. Producers never wait. The consumer either blocks in next() or probes
// with try_next().
//
// After close():
//   - try_enqueue() returns ChannelClosed,
//   - next() returns std::nullopt immediately, even if items remain,
//   - try_next() keeps returning the remaining items until the ring is empty.
template <typename T>
class RelayQueue {
public:
    explicit RelayQueue(std::size_t capacity) : capacity_(capacity), slots_(slot_count(capacity)) {}

    RelayQueue(const RelayQueue&) = delete;
    RelayQueue& operator=(const RelayQueue&) = delete;
    RelayQueue(RelayQueue&&) = delete;
    RelayQueue& operator=(RelayQueue&&) = delete;

    EnqueueResult try_enqueue(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return EnqueueResult::ChannelClosed;
            }
            std::size_t next_tail = advance(tail_);
            if (next_tail == head_) {
                ++stats_.dropped;
                return EnqueueResult::Dropped;
            }
            slots_[tail_] = std::move(item);
            tail_ = next_tail;
            ++stats_.enqueued;
        }
        not_empty_.notify_one();
        return EnqueueResult::Enqueued;
    }

    // Blocks until an item is available. Returns std::nullopt once the queue is closed.
    std::optional<T> next() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || head_ != tail_; });
        if (closed_) {
            return std::nullopt;
        }
        return pop_locked();
    }

    // Never blocks. Returns std::nullopt when nothing is queued.
    std::optional<T> try_next() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (head_ == tail_) {
            return std::nullopt;
        }
        return pop_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return (tail_ + slots_.size() - head_) % slots_.size();
    }

    std::size_t capacity() const { return capacity_; }

    RelayStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    static std::size_t slot_count(std::size_t capacity) {
        TL_FATAL(capacity > 0, "Relay queue capacity must be positive");
        TL_FATAL(
            capacity < std::numeric_limits<std::size_t>::max(),
            "Relay queue capacity {} leaves no room for the ring's spare slot",
            capacity);
        return capacity + 1;
    }

    std::size_t advance(std::size_t index) const { return (index + 1) % slots_.size(); }

    T pop_locked() {
        T item = std::move(*slots_[head_]);
        slots_[head_].reset();
        head_ = advance(head_);
        ++stats_.delivered;
        return item;
    }

    const std::size_t capacity_;
    std::vector<std::optional<T>> slots_;
    std::size_t head_ = 0;
    std::size_t tail_ = 0;
    bool closed_ = false;
    RelayStats stats_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
};

}  // namespace tracelink
