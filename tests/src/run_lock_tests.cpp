/**
 * @file run_lock_tests.cpp
 * @brief Tests for the exclusive run lock.
 */
#include "RunLock/RunLock.hpp"
#include "helpers/TestHelpers.hpp"

#include <gtest/gtest.h>

#include <system_error>

class RunLockTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        testDir = MakeCleanTestDirectory("vault_backup_run_lock_test");
        lockFile = testDir / "vault_backup.lock";
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    fs::path testDir;
    fs::path lockFile;
};

TEST_F(RunLockTest, TryAcquire_FreeLock_Succeeds)
{
    RunLock runLock(lockFile);

    EXPECT_TRUE(runLock.TryAcquire());
    EXPECT_TRUE(runLock.IsHeld());
    EXPECT_TRUE(fs::exists(lockFile));
}

TEST_F(RunLockTest, TryAcquire_HeldElsewhere_FailsWithoutWaiting)
{
    // Arrange
    RunLock holder(lockFile);
    ASSERT_TRUE(holder.TryAcquire());

    // Act
    RunLock contender(lockFile);
    const bool acquired = contender.TryAcquire();

    // Assert
    EXPECT_FALSE(acquired);
    EXPECT_FALSE(contender.IsHeld());
}

TEST_F(RunLockTest, Release_LetsNextHolderIn)
{
    RunLock holder(lockFile);
    ASSERT_TRUE(holder.TryAcquire());
    holder.Release();

    RunLock contender(lockFile);

    EXPECT_FALSE(holder.IsHeld());
    EXPECT_TRUE(contender.TryAcquire());
}

TEST_F(RunLockTest, Destructor_ReleasesLock)
{
    {
        RunLock holder(lockFile);
        ASSERT_TRUE(holder.TryAcquire());
    }

    RunLock contender(lockFile);
    EXPECT_TRUE(contender.TryAcquire());
}

TEST_F(RunLockTest, RunLockRelease_ReleasesOnScopeExit)
{
    RunLock holder(lockFile);
    {
        ASSERT_TRUE(holder.TryAcquire());
        RunLockRelease release(holder);
    }

    EXPECT_FALSE(holder.IsHeld());
}

TEST_F(RunLockTest, TryAcquire_UncreatableLockFile_Throws)
{
    RunLock runLock(testDir / "missing" / "vault_backup.lock");

    EXPECT_THROW(runLock.TryAcquire(), std::system_error);
}
