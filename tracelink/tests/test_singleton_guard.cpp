// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>

#include <tracelink/daemon/singleton_guard.hpp>
#include "test_utils.hpp"

namespace tracelink {
namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class SingletonGuardTest : public ::testing::Test {
protected:
    test::TempDir dir_;
    std::filesystem::path lock_path_ = dir_ / "run" / "tracelink.pid";
};

TEST_F(SingletonGuardTest, FirstAcquire_LocksAndWritesPid) {
    AcquireResult result = SingletonGuard::acquire(lock_path_);
    ASSERT_EQ(result.status, AcquireStatus::Locked);
    ASSERT_TRUE(result.guard.has_value());
    EXPECT_EQ(result.guard->lock_path().string(), lock_path_.string());
    EXPECT_EQ(read_file(lock_path_), std::to_string(getpid()) + "\n");
}

TEST_F(SingletonGuardTest, SecondAcquire_AlreadyRunningAndFileUntouched) {
    AcquireResult first = SingletonGuard::acquire(lock_path_);
    ASSERT_EQ(first.status, AcquireStatus::Locked);
    std::ofstream(lock_path_) << "sentinel";

    AcquireResult second = SingletonGuard::acquire(lock_path_);
    EXPECT_EQ(second.status, AcquireStatus::AlreadyRunning);
    EXPECT_FALSE(second.guard.has_value());
    EXPECT_EQ(read_file(lock_path_), "sentinel");
}

TEST_F(SingletonGuardTest, ReleasedGuard_CanBeReacquired) {
    {
        AcquireResult first = SingletonGuard::acquire(lock_path_);
        ASSERT_EQ(first.status, AcquireStatus::Locked);
    }
    EXPECT_TRUE(std::filesystem::exists(lock_path_));
    AcquireResult again = SingletonGuard::acquire(lock_path_);
    EXPECT_EQ(again.status, AcquireStatus::Locked);
}

TEST_F(SingletonGuardTest, MovedGuard_KeepsLock) {
    AcquireResult first = SingletonGuard::acquire(lock_path_);
    ASSERT_EQ(first.status, AcquireStatus::Locked);
    SingletonGuard moved = std::move(*first.guard);
    first.guard.reset();

    EXPECT_EQ(SingletonGuard::acquire(lock_path_).status, AcquireStatus::AlreadyRunning);
}

TEST_F(SingletonGuardTest, UnwritableLocation_IsIoError) {
    std::ofstream(dir_ / "file") << "not a directory";
    AcquireResult result = SingletonGuard::acquire(dir_ / "file" / "tracelink.pid");
    EXPECT_EQ(result.status, AcquireStatus::IoError);
    EXPECT_NE(result.error, 0);
}

}  // namespace
}  // namespace tracelink
