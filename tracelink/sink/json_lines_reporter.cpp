// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <fmt/format.h>
#include <google/protobuf/util/json_util.h>
#include <tt-logger/tt-logger.hpp>

#include <tracelink/sink/json_lines_reporter.hpp>

namespace tracelink {

JsonLinesReporter::JsonLinesReporter(const std::filesystem::path& path) :
    file_(path, std::ios::out | std::ios::app), out_(file_) {
    if (!file_.is_open()) {
        throw ReporterError(fmt::format("Failed to open reporter output {}", path.string()));
    }
    log_info(tt::LogAlways, "[Reporter] Writing JSON lines to {}", path.string());
}

JsonLinesReporter::JsonLinesReporter(std::ostream& out) : out_(out) {}

void JsonLinesReporter::run(CollectItemConsumer& consumer) {
    while (std::optional<CollectItem> item = consumer.next()) {
        write(*item);
    }

    uint64_t flushed = 0;
    while (std::optional<CollectItem> item = consumer.try_next()) {
        write(*item);
        ++flushed;
    }
    out_.flush();
    if (!out_) {
        throw ReporterError("Reporter output failed during final flush");
    }
    log_info(
        tt::LogAlways,
        "[Reporter] Channel closed, flushed {} queued items ({} written total)",
        flushed,
        items_written_);
}

void JsonLinesReporter::write(const CollectItem& item) {
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(item, &json, options);
    if (!status.ok()) {
        log_error(
            tt::LogAlways, "[Reporter] Could not convert {} item to JSON: {}", item_kind(item), status.ToString());
        return;
    }

    out_ << json << '\n';
    if (!out_) {
        throw ReporterError(fmt::format("Reporter output failed after {} items", items_written_));
    }
    ++items_written_;
}

}  // namespace tracelink
