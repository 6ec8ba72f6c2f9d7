// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <tracelink/daemon/lifecycle.hpp>
#include <tracelink/daemon/singleton_guard.hpp>
#include <tracelink/relay/channel_sender.hpp>
#include "test_utils.hpp"

namespace tracelink {
namespace {

// Keeps the payloads of every log item it drains.
class RecordingReporter : public Reporter {
public:
    void run(CollectItemConsumer& consumer) override {
        while (auto item = consumer.next()) {
            record(*item);
        }
        while (auto item = consumer.try_next()) {
            record(*item);
        }
    }

    std::vector<std::string> payloads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return payloads_;
    }

    uint64_t announcer_events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return announcer_events_;
    }

private:
    void record(const CollectItem& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (item.has_log()) {
            payloads_.push_back(item.log().payload());
        } else if (item.has_properties() || item.has_ping()) {
            ++announcer_events_;
        }
    }

    mutable std::mutex mutex_;
    std::vector<std::string> payloads_;
    uint64_t announcer_events_ = 0;
};

class FailingReporter : public Reporter {
public:
    void run(CollectItemConsumer&) override { throw ReporterError("upstream rejected the stream"); }
};

class FinishingReporter : public Reporter {
public:
    void run(CollectItemConsumer&) override {}
};

// Ignores close for a while, as a stuck upstream would.
class StuckReporter : public Reporter {
public:
    void run(CollectItemConsumer& consumer) override {
        while (consumer.next()) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
};

class DaemonLifecycleTest : public ::testing::Test {
protected:
    DaemonLifecycleTest() {
        config_.service_name = "lifecycle-test";
        config_.service_instance = "lifecycle-test-1";
        config_.runtime_dir = dir_.path();
        config_.socket_path = dir_ / "tracelink.sock";
        config_.lock_path = dir_ / "tracelink.pid";
        config_.worker_threads = 2;
        config_.heartbeat_period = std::chrono::hours(1);
        config_.shutdown_timeout = std::chrono::seconds(5);
    }

    ~DaemonLifecycleTest() override {
        if (runner_.joinable()) {
            daemon_->request_shutdown();
            runner_.join();
        }
    }

    void start(std::shared_ptr<Reporter> reporter) {
        daemon_ = std::make_unique<Daemon>(config_, std::move(reporter));
        runner_ = std::thread([this]() { exit_code_ = daemon_->run(); });
    }

    int join() {
        runner_.join();
        return exit_code_;
    }

    bool wait_running() {
        return test::wait_until([this] {
            return daemon_->state() == LifecycleState::Running && std::filesystem::exists(config_.socket_path);
        });
    }

    test::TempDir dir_;
    DaemonConfig config_;
    std::unique_ptr<Daemon> daemon_;
    std::thread runner_;
    int exit_code_ = -1;
};

TEST_F(DaemonLifecycleTest, RequestedShutdown_ExitsZeroAndRemovesSocket) {
    auto reporter = std::make_shared<RecordingReporter>();
    start(reporter);
    ASSERT_TRUE(wait_running());

    {
        ChannelSender sender(config_.socket_path);
        sender.send(test::make_log_item("one"));
        sender.send(test::make_log_item("two"));
    }
    ASSERT_TRUE(test::wait_until([&] { return reporter->payloads().size() == 2; }));
    EXPECT_EQ(reporter->payloads(), (std::vector<std::string>{"one", "two"}));
    EXPECT_GE(reporter->announcer_events(), 1u);

    daemon_->request_shutdown();
    EXPECT_EQ(join(), 0);
    EXPECT_EQ(daemon_->state(), LifecycleState::Stopped);
    EXPECT_FALSE(std::filesystem::exists(config_.socket_path));
    EXPECT_TRUE(std::filesystem::exists(config_.lock_path));
}

TEST_F(DaemonLifecycleTest, Sigterm_ExitsZeroAndRemovesSocket) {
    start(std::make_shared<RecordingReporter>());
    ASSERT_TRUE(wait_running());

    ASSERT_EQ(kill(getpid(), SIGTERM), 0);
    EXPECT_EQ(join(), 0);
    EXPECT_FALSE(std::filesystem::exists(config_.socket_path));
}

TEST_F(DaemonLifecycleTest, ReporterFailure_ExitsOneAndRemovesSocket) {
    start(std::make_shared<FailingReporter>());
    EXPECT_EQ(join(), 1);
    EXPECT_EQ(daemon_->state(), LifecycleState::Stopped);
    EXPECT_FALSE(std::filesystem::exists(config_.socket_path));
}

TEST_F(DaemonLifecycleTest, ReporterReturning_ExitsZero) {
    start(std::make_shared<FinishingReporter>());
    EXPECT_EQ(join(), 0);
    EXPECT_FALSE(std::filesystem::exists(config_.socket_path));
}

TEST_F(DaemonLifecycleTest, LockHeld_ExitsOneWithoutTouchingSocket) {
    AcquireResult held = SingletonGuard::acquire(config_.lock_path);
    ASSERT_EQ(held.status, AcquireStatus::Locked);

    auto reporter = std::make_shared<RecordingReporter>();
    start(reporter);
    EXPECT_EQ(join(), 1);
    EXPECT_FALSE(std::filesystem::exists(config_.socket_path));
    EXPECT_EQ(reporter->announcer_events(), 0u);
}

TEST_F(DaemonLifecycleTest, LockHeld_LeavesExistingSocketFileAlone) {
    AcquireResult held = SingletonGuard::acquire(config_.lock_path);
    ASSERT_EQ(held.status, AcquireStatus::Locked);
    std::ofstream(config_.socket_path) << "owned by the running instance";

    start(std::make_shared<RecordingReporter>());
    EXPECT_EQ(join(), 1);
    EXPECT_TRUE(std::filesystem::exists(config_.socket_path));
}

TEST_F(DaemonLifecycleTest, BindFailure_ExitsOne) {
    config_.socket_path = dir_ / "no-such-dir" / "tracelink.sock";
    start(std::make_shared<RecordingReporter>());
    EXPECT_EQ(join(), 1);
    EXPECT_EQ(daemon_->state(), LifecycleState::Stopped);
}

TEST_F(DaemonLifecycleTest, SocketPathIsDirectory_ExitsOneAndLeavesDirectory) {
    std::filesystem::create_directory(config_.socket_path);
    start(std::make_shared<RecordingReporter>());
    EXPECT_EQ(join(), 1);
    EXPECT_EQ(daemon_->state(), LifecycleState::Stopped);
    EXPECT_TRUE(std::filesystem::is_directory(config_.socket_path));
}

TEST_F(DaemonLifecycleTest, StuckReporter_ShutdownDeadlineBoundsExit) {
    config_.shutdown_timeout = std::chrono::milliseconds(50);
    start(std::make_shared<StuckReporter>());
    ASSERT_TRUE(wait_running());

    auto begin = std::chrono::steady_clock::now();
    daemon_->request_shutdown();
    EXPECT_EQ(join(), 0);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(400));
    EXPECT_FALSE(std::filesystem::exists(config_.socket_path));
}

TEST_F(DaemonLifecycleTest, RunTwice_Throws) {
    start(std::make_shared<FinishingReporter>());
    join();
    EXPECT_THROW(daemon_->run(), std::runtime_error);
}

TEST(ShutdownLatchTest, FirstCauseWins) {
    ShutdownLatch latch;
    EXPECT_FALSE(latch.cause().has_value());
    EXPECT_TRUE(latch.trigger(ShutdownCause::Signal));
    EXPECT_FALSE(latch.trigger(ShutdownCause::PipelineFailed));
    EXPECT_EQ(latch.wait(), ShutdownCause::Signal);
    EXPECT_EQ(latch.cause(), ShutdownCause::Signal);
}

TEST(ShutdownLatchTest, WaitBlocksUntilTriggered) {
    ShutdownLatch latch;
    std::thread trigger([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        latch.trigger(ShutdownCause::Requested);
    });
    EXPECT_EQ(latch.wait(), ShutdownCause::Requested);
    trigger.join();
}

}  // namespace
}  // namespace tracelink
