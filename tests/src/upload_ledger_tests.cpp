/**
 * @file upload_ledger_tests.cpp
 * @brief Tests for the append-only upload ledger.
 */
#include "SQLiteSession/SQLiteConnection.hpp"
#include "SQLiteSession/SQLiteSession.hpp"
#include "UploadLedger/UploadLedger.hpp"
#include "helpers/TestHelpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <thread>

namespace fs = std::filesystem;

class UploadLedgerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        testDir = MakeCleanTestDirectory("vault_backup_ledger_test");
        dbPath = testDir / "ledger.sqlite3";
        Open();
    }

    void TearDown() override
    {
        ledger.reset();
        session.reset();
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    void Open()
    {
        ledger.reset();
        session = std::make_unique<SQLiteSession>(dbPath);
        ledger = std::make_unique<UploadLedger>(*session);
        ledger->InitializeSchema();
    }

    fs::path testDir;
    fs::path dbPath;
    std::unique_ptr<SQLiteSession> session;
    std::unique_ptr<UploadLedger> ledger;
};

TEST_F(UploadLedgerTest, GetLastUploaded_UnknownPath_IsEmpty)
{
    EXPECT_FALSE(ledger->GetLastUploaded("/fake/file").has_value());
}

TEST_F(UploadLedgerTest, Record_ThenGetLastUploaded_ReturnsTimestamp)
{
    // Act
    ledger->Record("/data/file1", "file1", "archive-1", 1000);

    // Assert
    const auto lastUploaded = ledger->GetLastUploaded("/data/file1");
    ASSERT_TRUE(lastUploaded.has_value());
    EXPECT_EQ(1000, lastUploaded.value());
}

TEST_F(UploadLedgerTest, GetLastUploaded_UsesGreatestTimestampNotLastInsert)
{
    // Arrange: a backdated row inserted after a newer one
    ledger->Record("/data/file1", "file1", "archive-new", 2000);
    ledger->Record("/data/file1", "file1", "archive-old", 1500);

    // Act
    const auto lastUploaded = ledger->GetLastUploaded("/data/file1");

    // Assert
    ASSERT_TRUE(lastUploaded.has_value());
    EXPECT_EQ(2000, lastUploaded.value());
}

TEST_F(UploadLedgerTest, Record_SamePathTwice_KeepsBothRows)
{
    // Arrange
    ledger->Record("/data/dir1", "dir1.tar", "archive-2", 20);
    ledger->Record("/data/dir1", "dir1.tar", "archive-1", 10);
    ledger->Record("/data/other", "other", "archive-3", 30);

    // Act
    const std::vector<LedgerRecord> history = ledger->GetHistory("/data/dir1");

    // Assert
    ASSERT_EQ(2u, history.size());
    EXPECT_EQ("archive-1", history[0].archiveId);
    EXPECT_EQ(10, history[0].uploadedAtEpochSeconds);
    EXPECT_EQ("archive-2", history[1].archiveId);
    EXPECT_EQ("dir1.tar", history[1].uploadedName);
}

TEST_F(UploadLedgerTest, Record_IsVisibleAfterReopen)
{
    // Arrange
    ledger->Record("/data/file1", "file1", "archive-1", 42);

    // Act
    Open();

    // Assert
    const auto lastUploaded = ledger->GetLastUploaded("/data/file1");
    ASSERT_TRUE(lastUploaded.has_value());
    EXPECT_EQ(42, lastUploaded.value());
}

TEST_F(UploadLedgerTest, Record_WithoutTable_ThrowsLedgerError)
{
    // Arrange
    session->Acquire().ExecuteScript("DROP TABLE uploads;");

    // Act / Assert
    EXPECT_THROW(ledger->Record("/data/file1", "file1", "archive-1", 1), LedgerError);
    EXPECT_THROW(ledger->GetLastUploaded("/data/file1"), LedgerError);
}

TEST_F(UploadLedgerTest, RecordFromWorkerThread_UsesOwnConnection)
{
    // Act
    std::thread worker([this]() { ledger->Record("/data/file2", "file2", "archive-9", 77); });
    worker.join();

    // Assert
    EXPECT_EQ(2u, session->OpenConnections());
    const auto lastUploaded = ledger->GetLastUploaded("/data/file2");
    ASSERT_TRUE(lastUploaded.has_value());
    EXPECT_EQ(77, lastUploaded.value());
}

TEST(UploadLedgerOpenTest, InitializeSchema_UnopenableDatabase_ThrowsLedgerError)
{
    SQLiteSession session(fs::path("/nonexistent-directory-for-ledger-test") / "ledger.sqlite3");
    UploadLedger ledger(session);

    EXPECT_THROW(ledger.InitializeSchema(), LedgerError);
}
