// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include <tracelink/sink/consumer.hpp>

namespace tracelink {

// Unrecoverable upstream failure. Ends the pipeline; the daemon exits with status 1.
class ReporterError : public std::runtime_error {
public:
    explicit ReporterError(const std::string& message) : std::runtime_error(message) {}
};

// Upstream transport. run() drains the consumer until next() reports the channel closed, flushes whatever
// try_next() still yields, and returns. Throws ReporterError on a fatal transport failure.
class Reporter {
public:
    virtual ~Reporter() = default;
    virtual void run(CollectItemConsumer& consumer) = 0;
};

}  // namespace tracelink
