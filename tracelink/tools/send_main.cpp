// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

/*
 * send_main.cpp
 * tracelink_send: forwards stdin lines to a running tracelinkd as log batches, one frame per line.
 */

#include <exception>
#include <iostream>
#include <string>

#include <cxxopts.hpp>
#include <tt-logger/tt-logger.hpp>

#include <tracelink/relay/channel_sender.hpp>

int main(int argc, char* argv[]) {
    cxxopts::Options options("tracelink_send", "Send stdin lines to tracelinkd as log batches");

    options.add_options()(
        "socket-path",
        "Daemon IPC socket",
        cxxopts::value<std::string>()->default_value("/tmp/tracelink/tracelink.sock"))(
        "service-name", "Service the logs belong to", cxxopts::value<std::string>()->default_value("tracelink_send"))(
        "service-instance", "Service instance the logs belong to", cxxopts::value<std::string>()->default_value(""))(
        "h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        tracelink::ChannelSender sender(result["socket-path"].as<std::string>());
        std::string service = result["service-name"].as<std::string>();
        std::string instance = result["service-instance"].as<std::string>();

        uint64_t sent = 0;
        std::string line;
        while (std::getline(std::cin, line)) {
            tracelink::CollectItem item;
            tracelink::proto::LogBatch* log = item.mutable_log();
            log->set_service(service);
            log->set_service_instance(instance);
            log->set_payload(line);
            sender.send(item);
            ++sent;
        }
        log_info(tt::LogAlways, "Sent {} log lines", sent);
    } catch (const std::exception& e) {
        log_error(tt::LogAlways, "tracelink_send failed: {}", e.what());
        return 1;
    }
    return 0;
}
