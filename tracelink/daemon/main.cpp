// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

/*
 * main.cpp
 * tracelinkd: relays telemetry from local producers to the upstream reporter.
 */

#include <exception>
#include <iostream>
#include <memory>
#include <optional>

#include <tt-logger/tt-logger.hpp>

#include <tracelink/daemon/config.hpp>
#include <tracelink/daemon/lifecycle.hpp>
#include <tracelink/daemon/process.hpp>
#include <tracelink/sink/json_lines_reporter.hpp>

static std::shared_ptr<tracelink::Reporter> make_reporter(const tracelink::DaemonConfig& config) {
    if (config.output == "-") {
        return std::make_shared<tracelink::JsonLinesReporter>(std::cout);
    }
    return std::make_shared<tracelink::JsonLinesReporter>(std::filesystem::path(config.output));
}

int main(int argc, char* argv[]) {
    std::optional<tracelink::DaemonConfig> config;
    try {
        config = tracelink::parse_config(argc, argv, std::cout);
    } catch (const std::exception& e) {
        log_critical(tt::LogAlways, "Invalid command line: {}", e.what());
        return 1;
    }
    if (!config) {
        return 0;
    }

    try {
        if (config->daemonize && tracelink::spawn_detached() == tracelink::SpawnRole::Launcher) {
            return 0;
        }
        tracelink::Daemon daemon(*config, make_reporter(*config));
        return daemon.run();
    } catch (const std::exception& e) {
        log_critical(tt::LogAlways, "tracelinkd failed to start: {}", e.what());
        return 1;
    }
}
