// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <unistd.h>

#include <map>
#include <string>

#include <tracelink/daemon/instance_properties.hpp>

namespace tracelink {
namespace {

std::multimap<std::string, std::string> properties_of(const CollectItem& item) {
    std::multimap<std::string, std::string> properties;
    for (const auto& pair : item.properties().properties()) {
        properties.emplace(pair.key(), pair.value());
    }
    return properties;
}

class InstancePropertiesTest : public ::testing::Test {
protected:
    InstancePropertiesTest() {
        config_.service_name = "checkout";
        config_.service_instance = "checkout-1";
        config_.language = "cpp";
    }

    DaemonConfig config_;
};

TEST_F(InstancePropertiesTest, CarriesIdentityAndHostFacts) {
    CollectItem item = build_instance_properties(config_);
    ASSERT_EQ(item.item_case(), CollectItem::kProperties);
    EXPECT_EQ(item.properties().service(), "checkout");
    EXPECT_EQ(item.properties().service_instance(), "checkout-1");

    auto properties = properties_of(item);
    ASSERT_EQ(properties.count(std::string(kPropertyHostName)), 1u);
    EXPECT_EQ(properties.find(std::string(kPropertyHostName))->second, host_name());
    EXPECT_EQ(properties.find(std::string(kPropertyOsName))->second, os_name());
    EXPECT_EQ(properties.find(std::string(kPropertyLanguage))->second, "cpp");
    EXPECT_EQ(properties.find(std::string(kPropertyProcessNo))->second, std::to_string(getppid()));
    EXPECT_EQ(properties.count(std::string(kPropertyIpv4)), ipv4_addresses().size());
}

TEST_F(InstancePropertiesTest, Ipv4AddressesExcludeLoopback) {
    EXPECT_THAT(ipv4_addresses(), ::testing::Not(::testing::Contains("127.0.0.1")));
}

TEST_F(InstancePropertiesTest, PingCarriesIdentityAndTimestamp) {
    CollectItem item = build_instance_ping(config_);
    ASSERT_EQ(item.item_case(), CollectItem::kPing);
    EXPECT_EQ(item.ping().service(), "checkout");
    EXPECT_EQ(item.ping().service_instance(), "checkout-1");
    EXPECT_GT(item.ping().timestamp_ms(), 0);
}

TEST_F(InstancePropertiesTest, HostNameIsNotEmpty) {
    EXPECT_FALSE(host_name().empty());
    EXPECT_FALSE(os_name().empty());
}

}  // namespace
}  // namespace tracelink
