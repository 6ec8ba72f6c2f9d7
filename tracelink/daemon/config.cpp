// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <thread>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cxxopts.hpp>

#include <tracelink/common/assert.hpp>
#include <tracelink/daemon/config.hpp>
#include <tracelink/daemon/instance_properties.hpp>

namespace tracelink {

uint32_t DaemonConfig::resolved_worker_threads() const {
    if (worker_threads > 0) {
        return worker_threads;
    }
    uint32_t num_threads = std::thread::hardware_concurrency();
    return num_threads > 0 ? num_threads : 1;
}

std::string generate_service_instance() {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator()) + "@" + host_name();
}

DaemonConfig finalize_config(DaemonConfig config) {
    if (config.service_instance.empty()) {
        config.service_instance = generate_service_instance();
    }
    if (config.socket_path.empty()) {
        config.socket_path = config.runtime_dir / "tracelink.sock";
    }
    if (config.lock_path.empty()) {
        config.lock_path = config.runtime_dir / "tracelink.pid";
    }

    TL_FATAL(!config.service_name.empty(), "Service name must not be empty");
    TL_FATAL(!config.runtime_dir.empty(), "Runtime directory must not be empty");
    TL_FATAL(config.queue_capacity > 0, "Queue capacity must be positive");
    TL_FATAL(
        config.queue_capacity <= kMaxQueueCapacity,
        "Queue capacity {} exceeds the limit of {}",
        config.queue_capacity,
        kMaxQueueCapacity);
    TL_FATAL(config.heartbeat_period.count() > 0, "Heartbeat period must be positive");
    TL_FATAL(config.properties_report_period_factor > 0, "Properties report period factor must be positive");
    TL_FATAL(config.max_frame_size > 0, "Maximum frame size must be positive");
    TL_FATAL(
        config.max_frame_size <= kMaxFrameSizeLimit,
        "Maximum frame size {} exceeds the limit of {} bytes",
        config.max_frame_size,
        kMaxFrameSizeLimit);
    TL_FATAL(
        config.socket_path != config.lock_path,
        "Socket path and lock path must differ (both are {})",
        config.socket_path.string());
    return config;
}

std::optional<DaemonConfig> parse_config(int argc, char* argv[], std::ostream& out) {
    DaemonConfig defaults;
    cxxopts::Options options("tracelinkd", "Telemetry relay daemon: local producers in, upstream reporter out");

    options.add_options()(
        "service-name",
        "Service the instance registers under",
        cxxopts::value<std::string>()->default_value(defaults.service_name))(
        "service-instance",
        "Service instance name (default: random UUID @ hostname)",
        cxxopts::value<std::string>()->default_value(""))(
        "language",
        "Language tag reported in instance properties",
        cxxopts::value<std::string>()->default_value(defaults.language))(
        "runtime-dir",
        "Directory holding the IPC socket and the lock file",
        cxxopts::value<std::string>()->default_value(defaults.runtime_dir.string()))(
        "socket-path", "IPC socket path (default: <runtime-dir>/tracelink.sock)", cxxopts::value<std::string>())(
        "lock-path", "Singleton lock file path (default: <runtime-dir>/tracelink.pid)", cxxopts::value<std::string>())(
        "worker-threads",
        "Worker thread count, 0 for host parallelism",
        cxxopts::value<uint32_t>()->default_value("0"))(
        "heartbeat-period", "Seconds between announcer events", cxxopts::value<uint32_t>()->default_value("30"))(
        "properties-report-period-factor",
        "Announcer ticks per full instance properties report",
        cxxopts::value<uint32_t>()->default_value("10"))(
        "queue-capacity", "Relay queue capacity in items", cxxopts::value<std::size_t>()->default_value("255"))(
        "max-frame-size",
        "Largest accepted frame payload in bytes",
        cxxopts::value<std::size_t>()->default_value("16777216"))(
        "shutdown-timeout",
        "Seconds to wait for the final flush on shutdown",
        cxxopts::value<uint32_t>()->default_value("10"))(
        "output", "Reporter output file, - for stdout", cxxopts::value<std::string>()->default_value("-"))(
        "daemonize", "Detach into a background worker and exit", cxxopts::value<bool>()->default_value("false"))(
        "h,help", "Print usage");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        out << options.help() << std::endl;
        return std::nullopt;
    }

    DaemonConfig config;
    config.service_name = result["service-name"].as<std::string>();
    config.service_instance = result["service-instance"].as<std::string>();
    config.language = result["language"].as<std::string>();
    config.runtime_dir = result["runtime-dir"].as<std::string>();
    if (result.count("socket-path")) {
        config.socket_path = result["socket-path"].as<std::string>();
    }
    if (result.count("lock-path")) {
        config.lock_path = result["lock-path"].as<std::string>();
    }
    config.worker_threads = result["worker-threads"].as<uint32_t>();
    config.heartbeat_period = std::chrono::seconds(result["heartbeat-period"].as<uint32_t>());
    config.properties_report_period_factor = result["properties-report-period-factor"].as<uint32_t>();
    config.queue_capacity = result["queue-capacity"].as<std::size_t>();
    config.max_frame_size = result["max-frame-size"].as<std::size_t>();
    config.shutdown_timeout = std::chrono::seconds(result["shutdown-timeout"].as<uint32_t>());
    config.output = result["output"].as<std::string>();
    config.daemonize = result["daemonize"].as<bool>();

    return finalize_config(std::move(config));
}

}  // namespace tracelink
