// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <tracelink/daemon/config.hpp>
#include <tracelink/relay/collect_item.hpp>

namespace tracelink {

// Property keys understood by the backend.
inline constexpr std::string_view kPropertyHostName = "hostname";
inline constexpr std::string_view kPropertyOsName = "OS Name";
inline constexpr std::string_view kPropertyIpv4 = "ipv4";
inline constexpr std::string_view kPropertyLanguage = "language";
inline constexpr std::string_view kPropertyProcessNo = "Process No.";

std::string host_name();
std::string os_name();
// Non-loopback IPv4 addresses of the host's interfaces, in interface order.
std::vector<std::string> ipv4_addresses();

// Reads every host fact live; nothing is cached between calls. `process_no` is the parent process id.
CollectItem build_instance_properties(const DaemonConfig& config);

CollectItem build_instance_ping(const DaemonConfig& config);

}  // namespace tracelink
