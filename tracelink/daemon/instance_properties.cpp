// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>

#include <tt-logger/tt-logger.hpp>

#include <tracelink/common/assert.hpp>
#include <tracelink/common/cleanup.hpp>
#include <tracelink/daemon/instance_properties.hpp>

namespace tracelink {

std::string host_name() {
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        TL_THROW("Failed to get hostname (errno={})", errno);
    }
    hostname[sizeof(hostname) - 1] = '\0';
    return std::string(hostname);
}

std::string os_name() {
    struct utsname info {};
    if (uname(&info) != 0) {
        log_warning(tt::LogAlways, "[Announcer] uname() failed (errno={})", errno);
        return "Unknown";
    }
    return std::string(info.sysname);
}

std::vector<std::string> ipv4_addresses() {
    std::vector<std::string> addresses;
    struct ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        log_warning(tt::LogAlways, "[Announcer] getifaddrs() failed (errno={})", errno);
        return addresses;
    }
    auto free_interfaces = make_scope_exit([interfaces]() { freeifaddrs(interfaces); });

    for (struct ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        const auto* address = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
        if (ntohl(address->sin_addr.s_addr) == INADDR_LOOPBACK) {
            continue;
        }
        char buffer[INET_ADDRSTRLEN] = {};
        if (inet_ntop(AF_INET, &address->sin_addr, buffer, sizeof(buffer)) != nullptr) {
            addresses.emplace_back(buffer);
        }
    }
    return addresses;
}

static void add_property(proto::InstanceProperties& properties, std::string_view key, std::string value) {
    proto::KeyStringValuePair* pair = properties.add_properties();
    pair->set_key(std::string(key));
    pair->set_value(std::move(value));
}

CollectItem build_instance_properties(const DaemonConfig& config) {
    CollectItem item;
    proto::InstanceProperties* properties = item.mutable_properties();
    properties->set_service(config.service_name);
    properties->set_service_instance(config.service_instance);

    add_property(*properties, kPropertyHostName, host_name());
    add_property(*properties, kPropertyOsName, os_name());
    for (std::string& address : ipv4_addresses()) {
        add_property(*properties, kPropertyIpv4, std::move(address));
    }
    add_property(*properties, kPropertyLanguage, config.language);
    add_property(*properties, kPropertyProcessNo, std::to_string(getppid()));
    return item;
}

CollectItem build_instance_ping(const DaemonConfig& config) {
    CollectItem item;
    proto::InstancePing* ping = item.mutable_ping();
    ping->set_service(config.service_name);
    ping->set_service_instance(config.service_instance);
    ping->set_timestamp_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count());
    return item;
}

}  // namespace tracelink
