// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include <tracelink/relay/collect_item.hpp>
#include <tracelink/relay/frame_reader.hpp>
#include <tracelink/relay/relay_queue.hpp>

namespace tracelink {

// One producer session. Owns the frame source and runs the receive loop over it:
//   item           -> try_enqueue, keep going (a Dropped item is logged and forgotten)
//   EndOfStream    -> stop quietly
//   DecodeError    -> log, keep going; kMaxConsecutiveTransportErrors transport errors in a row stop the loop
//   ChannelClosed  -> stop, nobody is consuming anymore
// Keeps itself alive through the pending read handler, so callers may drop their reference after start().
class Connection : public std::enable_shared_from_this<Connection> {
public:
    // Transport errors in a row after which the session is abandoned.
    static constexpr uint32_t kMaxConsecutiveTransportErrors = 8;

    Connection(std::unique_ptr<FrameSource> source, uint64_t id, RelayQueue<CollectItem>& queue);

    void start();

    uint64_t id() const { return id_; }

private:
    void receive_next();
    // Returns true when the loop should continue.
    bool handle(ReceiveResult result);
    bool forward(CollectItem item);

    std::unique_ptr<FrameSource> source_;
    RelayQueue<CollectItem>& queue_;
    const uint64_t id_;
    uint64_t frames_received_ = 0;
    uint32_t consecutive_transport_errors_ = 0;
};

}  // namespace tracelink
