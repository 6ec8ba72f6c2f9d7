// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <ostream>
#include <string>

namespace tracelink {

// The relay queue preallocates one slot per item.
inline constexpr std::size_t kMaxQueueCapacity = 1 << 20;
// Frame payloads are handed to protobuf, which takes an int length.
inline constexpr std::size_t kMaxFrameSizeLimit = std::numeric_limits<int>::max();

// Immutable daemon settings. Built once by parse_config() and handed by const reference to every component.
struct DaemonConfig {
    std::string service_name = "tracelink";
    std::string service_instance;
    std::string language = "cpp";

    std::filesystem::path runtime_dir = "/tmp/tracelink";
    std::filesystem::path socket_path;
    std::filesystem::path lock_path;

    // 0 selects the host's hardware concurrency.
    uint32_t worker_threads = 0;

    std::chrono::milliseconds heartbeat_period = std::chrono::seconds(30);
    uint32_t properties_report_period_factor = 10;

    std::size_t queue_capacity = 255;
    std::size_t max_frame_size = 16 * 1024 * 1024;

    std::chrono::milliseconds shutdown_timeout = std::chrono::seconds(10);

    // JSON-lines reporter destination, "-" for stdout.
    std::string output = "-";

    bool daemonize = false;

    uint32_t resolved_worker_threads() const;
};

// Fills in derived defaults (instance name, socket and lock paths under runtime_dir) and validates the result.
// Throws std::runtime_error on an invalid combination.
DaemonConfig finalize_config(DaemonConfig config);

// Parses the command line. Returns std::nullopt after printing usage to `out` when --help was given.
// Throws on unknown options or invalid values.
std::optional<DaemonConfig> parse_config(int argc, char* argv[], std::ostream& out);

std::string generate_service_instance();

}  // namespace tracelink
