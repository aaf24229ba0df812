/**
 * @file candidate_scanner_tests.cpp
 * @brief Tests for candidate selection and the upload-needed policy.
 */
#include "CandidateScanner/CandidateScanner.hpp"
#include "SQLiteSession/SQLiteConnection.hpp"
#include "SQLiteSession/SQLiteSession.hpp"
#include "UploadLedger/UploadLedger.hpp"
#include "helpers/TestHelpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>

#include <fcntl.h>
#include <sys/stat.h>

using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace
{
void SetModifiedTime(const fs::path& path, std::int64_t seconds, long nanoseconds)
{
    struct timespec times[2] = {};
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = static_cast<time_t>(seconds);
    times[1].tv_nsec = nanoseconds;
    ASSERT_EQ(0, ::utimensat(AT_FDCWD, path.c_str(), times, 0));
}
}

class CandidateScannerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        testDir = MakeCleanTestDirectory("vault_backup_scanner_test");
        backupDir = testDir / "backup_dir";
        WriteTextFile(backupDir / "file1", "one");
        WriteTextFile(backupDir / "file2", "two");
        fs::create_directories(backupDir / "dir1");
        fs::create_directories(backupDir / "dir2");
        WriteTextFile(backupDir / "dir1" / "nested", "not listed");

        session = std::make_unique<SQLiteSession>(testDir / "ledger.sqlite3");
        ledger = std::make_unique<UploadLedger>(*session);
        ledger->InitializeSchema();
        scanner = std::make_unique<CandidateScanner>(*ledger);
    }

    void TearDown() override
    {
        scanner.reset();
        ledger.reset();
        session.reset();
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    std::vector<fs::path> Collect(const std::vector<BackupTarget>& targets)
    {
        std::vector<fs::path> candidates;
        scanner->ForEachCandidate(targets,
                                  [&](const Candidate& candidate)
                                  {
                                      candidates.push_back(candidate.path);
                                      return true;
                                  });
        return candidates;
    }

    std::vector<std::string> CollectNames(const TargetPolicy& policy)
    {
        return SortedFileNames(Collect({BackupTarget{backupDir, policy}}));
    }

    fs::path testDir;
    fs::path backupDir;
    std::unique_ptr<SQLiteSession> session;
    std::unique_ptr<UploadLedger> ledger;
    std::unique_ptr<CandidateScanner> scanner;
};

TEST_F(CandidateScannerTest, UploadFilesOnly_YieldsFiles)
{
    TargetPolicy policy;
    policy.uploadFiles = true;

    EXPECT_THAT(CollectNames(policy), ElementsAre("file1", "file2"));
}

TEST_F(CandidateScannerTest, UploadDirsOnly_YieldsDirectories)
{
    TargetPolicy policy;
    policy.uploadDirs = true;

    EXPECT_THAT(CollectNames(policy), ElementsAre("dir1", "dir2"));
}

TEST_F(CandidateScannerTest, UploadFilesAndDirs_YieldsAllFourInNameOrder)
{
    // Arrange
    TargetPolicy policy;
    policy.uploadFiles = true;
    policy.uploadDirs = true;

    // Act
    const std::vector<fs::path> candidates = Collect({BackupTarget{backupDir, policy}});

    // Assert
    EXPECT_THAT(candidates, ElementsAre(backupDir / "dir1", backupDir / "dir2", backupDir / "file1", backupDir / "file2"));
}

TEST_F(CandidateScannerTest, SingleDir_OverridesPerEntrySelection)
{
    // Arrange
    TargetPolicy policy;
    policy.uploadSingleDir = true;
    policy.uploadFiles = true;
    policy.uploadDirs = true;

    // Act
    const std::vector<fs::path> candidates = Collect({BackupTarget{backupDir, policy}});

    // Assert
    EXPECT_THAT(candidates, ElementsAre(backupDir));
}

TEST_F(CandidateScannerTest, SingleDir_IsReportedAsDirectory)
{
    TargetPolicy policy;
    policy.uploadSingleDir = true;
    bool isDirectory = false;

    scanner->ForEachCandidate({BackupTarget{backupDir, policy}},
                              [&](const Candidate& candidate)
                              {
                                  isDirectory = candidate.isDirectory;
                                  return true;
                              });

    EXPECT_TRUE(isDirectory);
}

TEST_F(CandidateScannerTest, ExcludePrefix_SkipsMatchingEntries)
{
    TargetPolicy policy;
    policy.uploadFiles = true;
    policy.uploadDirs = true;
    policy.excludePrefix = "dir";

    EXPECT_THAT(CollectNames(policy), ElementsAre("file1", "file2"));
}

TEST_F(CandidateScannerTest, NoSelectionFlags_YieldsNothing)
{
    EXPECT_THAT(CollectNames(TargetPolicy{}), IsEmpty());
}

TEST_F(CandidateScannerTest, FileTarget_IsYieldedRegardlessOfPolicy)
{
    // Arrange: the file is already in the ledger and no flags are set
    ledger->Record((backupDir / "file1").string(), "file1", "archive-1", 1);

    // Act
    const std::vector<fs::path> candidates = Collect({BackupTarget{backupDir / "file1", TargetPolicy{}}});

    // Assert
    EXPECT_THAT(candidates, ElementsAre(backupDir / "file1"));
}

TEST_F(CandidateScannerTest, NonexistentTarget_IsSkipped)
{
    TargetPolicy policy;
    policy.uploadFiles = true;

    const std::vector<fs::path> candidates = Collect({BackupTarget{testDir / "missing", policy}, BackupTarget{backupDir / "file2", policy}});

    EXPECT_THAT(candidates, ElementsAre(backupDir / "file2"));
}

TEST_F(CandidateScannerTest, AlreadyUploadedEntries_AreSkipped)
{
    // Arrange
    ledger->Record((backupDir / "file1").string(), "file1", "archive-1", 1);
    TargetPolicy policy;
    policy.uploadFiles = true;

    // Act / Assert
    EXPECT_THAT(CollectNames(policy), ElementsAre("file2"));
}

TEST_F(CandidateScannerTest, NeedsUpload_NoRecord_IsTrue)
{
    EXPECT_TRUE(scanner->NeedsUpload(testDir / "fake" / "file", false));
    EXPECT_TRUE(scanner->NeedsUpload(testDir / "fake" / "file", true));
}

TEST_F(CandidateScannerTest, NeedsUpload_RecordWithoutIfChanged_IsFalse)
{
    const fs::path entry = backupDir / "dir1";
    ledger->Record(entry.string(), "dir1.tar", "archive-1", 0);

    EXPECT_FALSE(scanner->NeedsUpload(entry, false));
}

TEST_F(CandidateScannerTest, NeedsUpload_IfChanged_ComparesModificationTimeStrictly)
{
    const fs::path entry = backupDir / "file1";
    SetModifiedTime(entry, 2000, 0);

    ledger->Record(entry.string(), "file1", "archive-1", 1990);
    EXPECT_TRUE(scanner->NeedsUpload(entry, true));

    ledger->Record(entry.string(), "file1", "archive-2", 2000);
    EXPECT_FALSE(scanner->NeedsUpload(entry, true));

    ledger->Record(entry.string(), "file1", "archive-3", 2010);
    EXPECT_FALSE(scanner->NeedsUpload(entry, true));
}

TEST_F(CandidateScannerTest, NeedsUpload_IfChanged_SubSecondModification_IsTrue)
{
    // Arrange: modified half a second into the second the upload was recorded
    const fs::path entry = backupDir / "file1";
    SetModifiedTime(entry, 1000, 500000000);
    ledger->Record(entry.string(), "file1", "archive-1", 1000);

    // Act / Assert
    EXPECT_TRUE(scanner->NeedsUpload(entry, true));
    EXPECT_FALSE(scanner->NeedsUpload(entry, false));
}

TEST_F(CandidateScannerTest, NeedsUpload_IfChanged_SubSecondModificationBeforeUpload_IsFalse)
{
    const fs::path entry = backupDir / "file1";
    SetModifiedTime(entry, 999, 900000000);
    ledger->Record(entry.string(), "file1", "archive-1", 1000);

    EXPECT_FALSE(scanner->NeedsUpload(entry, true));
}

TEST_F(CandidateScannerTest, StopFromCallback_EndsScan)
{
    // Arrange
    TargetPolicy policy;
    policy.uploadFiles = true;
    policy.uploadDirs = true;
    std::vector<fs::path> candidates;

    // Act
    const bool completed = scanner->ForEachCandidate({BackupTarget{backupDir, policy}, BackupTarget{backupDir / "file1", policy}},
                                                     [&](const Candidate& candidate)
                                                     {
                                                         candidates.push_back(candidate.path);
                                                         return false;
                                                     });

    // Assert
    EXPECT_FALSE(completed);
    EXPECT_THAT(candidates, ElementsAre(backupDir / "dir1"));
}

TEST_F(CandidateScannerTest, NextTarget_IsNotInspectedBeforeCurrentTargetIsConsumed)
{
    // Arrange: the second target only appears while the first is being consumed
    const fs::path lateTarget = testDir / "late";
    TargetPolicy policy;
    policy.uploadFiles = true;
    TargetPolicy latePolicy;
    latePolicy.uploadSingleDir = true;
    std::vector<fs::path> candidates;

    // Act
    scanner->ForEachCandidate({BackupTarget{backupDir, policy}, BackupTarget{lateTarget, latePolicy}},
                              [&](const Candidate& candidate)
                              {
                                  candidates.push_back(candidate.path);
                                  fs::create_directories(lateTarget);
                                  return true;
                              });

    // Assert
    EXPECT_THAT(candidates, ElementsAre(backupDir / "file1", backupDir / "file2", lateTarget));
}

TEST_F(CandidateScannerTest, LedgerFailure_PropagatesAsLedgerError)
{
    // Arrange
    session->Acquire().ExecuteScript("DROP TABLE uploads;");
    TargetPolicy policy;
    policy.uploadFiles = true;

    // Act / Assert
    EXPECT_THROW(Collect({BackupTarget{backupDir, policy}}), LedgerError);
}
