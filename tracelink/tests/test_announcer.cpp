// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include <tracelink/daemon/announcer.hpp>
#include "test_utils.hpp"

namespace tracelink {
namespace {

class AnnouncerTest : public ::testing::Test {
protected:
    AnnouncerTest() {
        config_.service_name = "svc";
        config_.service_instance = "svc-1";
        config_.heartbeat_period = std::chrono::milliseconds(20);
        config_.properties_report_period_factor = 3;
    }

    void TearDown() override {
        if (announcer_) {
            announcer_->stop();
        }
        pool_.stop();
        pool_.join();
    }

    RelayQueue<CollectItem>& start(std::size_t capacity) {
        queue_ = std::make_unique<RelayQueue<CollectItem>>(capacity);
        announcer_ = std::make_shared<Announcer>(pool_.get_executor(), config_, *queue_);
        announcer_->start();
        return *queue_;
    }

    DaemonConfig config_;
    // Must outlive the pool.
    std::unique_ptr<RelayQueue<CollectItem>> queue_;
    boost::asio::thread_pool pool_{2};
    std::shared_ptr<Announcer> announcer_;
};

TEST_F(AnnouncerTest, PropertiesEveryFactorTicksPingsOtherwise) {
    RelayQueue<CollectItem>& queue = start(64);
    ASSERT_TRUE(test::wait_until([&] { return queue.size() >= 7; }));
    announcer_->stop();

    for (int tick = 0; tick < 7; ++tick) {
        std::optional<CollectItem> event = queue.try_next();
        ASSERT_TRUE(event.has_value());
        if (tick % 3 == 0) {
            EXPECT_EQ(event->item_case(), CollectItem::kProperties) << "tick " << tick;
            EXPECT_EQ(event->properties().service_instance(), "svc-1");
        } else {
            EXPECT_EQ(event->item_case(), CollectItem::kPing) << "tick " << tick;
            EXPECT_EQ(event->ping().service(), "svc");
        }
    }
}

TEST_F(AnnouncerTest, FirstTickIsImmediate) {
    config_.heartbeat_period = std::chrono::seconds(60);
    RelayQueue<CollectItem>& queue = start(8);

    ASSERT_TRUE(test::wait_until([&] { return queue.size() == 1; }, std::chrono::seconds(2)));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.try_next()->item_case(), CollectItem::kProperties);
}

TEST_F(AnnouncerTest, FullQueue_DropsEventsAndKeepsTicking) {
    RelayQueue<CollectItem>& queue = start(1);

    ASSERT_TRUE(test::wait_until([&] { return announcer_->ticks() >= 4; }));
    EXPECT_EQ(queue.size(), 1u);
    EXPECT_GE(queue.stats().dropped, 3u);
}

TEST_F(AnnouncerTest, ClosedQueue_StopsAnnouncing) {
    config_.heartbeat_period = std::chrono::milliseconds(10);
    queue_ = std::make_unique<RelayQueue<CollectItem>>(8);
    queue_->close();
    announcer_ = std::make_shared<Announcer>(pool_.get_executor(), config_, *queue_);
    announcer_->start();

    ASSERT_TRUE(test::wait_until([&] { return announcer_->ticks() == 1; }));
    std::this_thread::sleep_for(config_.heartbeat_period * 5);
    EXPECT_EQ(announcer_->ticks(), 1u);
}

TEST_F(AnnouncerTest, StopHaltsTicks) {
    start(64);
    ASSERT_TRUE(test::wait_until([&] { return announcer_->ticks() >= 2; }));
    announcer_->stop();

    // Let the posted stop take effect.
    std::this_thread::sleep_for(config_.heartbeat_period * 2);
    uint64_t ticks = announcer_->ticks();
    std::this_thread::sleep_for(config_.heartbeat_period * 5);
    EXPECT_EQ(announcer_->ticks(), ticks);
}

}  // namespace
}  // namespace tracelink
