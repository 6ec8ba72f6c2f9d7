// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>

#include <tracelink/relay/collect_item.hpp>
#include <tracelink/relay/relay_queue.hpp>

namespace tracelink {

// Receiving end of the relay queue as seen by a reporter.
class CollectItemConsumer {
public:
    virtual ~CollectItemConsumer() = default;

    // Blocks until an item arrives. std::nullopt means the channel is closed and streaming should end.
    virtual std::optional<CollectItem> next() = 0;

    // Never blocks. std::nullopt means nothing is queued right now. Used to flush what is left after close.
    virtual std::optional<CollectItem> try_next() = 0;
};

class RelayConsumer : public CollectItemConsumer {
public:
    explicit RelayConsumer(std::shared_ptr<RelayQueue<CollectItem>> queue) : queue_(std::move(queue)) {}

    std::optional<CollectItem> next() override { return queue_->next(); }
    std::optional<CollectItem> try_next() override { return queue_->try_next(); }

private:
    std::shared_ptr<RelayQueue<CollectItem>> queue_;
};

}  // namespace tracelink
