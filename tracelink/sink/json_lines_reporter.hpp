// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ostream>

#include <tracelink/sink/reporter.hpp>

namespace tracelink {

// Writes every drained item as one JSON object per line, using the protobuf JSON mapping with the .proto field
// names.
class JsonLinesReporter : public Reporter {
public:
    // Appends to `path`. Throws ReporterError if the file cannot be opened.
    explicit JsonLinesReporter(const std::filesystem::path& path);
    // Writes to a caller-owned stream, which must outlive the reporter.
    explicit JsonLinesReporter(std::ostream& out);

    void run(CollectItemConsumer& consumer) override;

    uint64_t items_written() const { return items_written_; }

private:
    void write(const CollectItem& item);

    std::ofstream file_;
    std::ostream& out_;
    uint64_t items_written_ = 0;
};

}  // namespace tracelink
