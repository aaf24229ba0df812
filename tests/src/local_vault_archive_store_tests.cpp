/**
 * @file local_vault_archive_store_tests.cpp
 * @brief Tests for the directory-backed vault.
 */
#include "ArchiveStore/LocalVaultArchiveStore.hpp"
#include "UploadCoordinator/UploadCoordinator.hpp"
#include "helpers/TestHelpers.hpp"

#include <gtest/gtest.h>

class LocalVaultArchiveStoreTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        testDir = MakeCleanTestDirectory("vault_backup_local_vault_test");
        vault = std::make_unique<LocalVaultArchiveStore>(testDir / "vault");
    }

    void TearDown() override
    {
        vault.reset();
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    fs::path testDir;
    std::unique_ptr<LocalVaultArchiveStore> vault;
    TreeHasher hasher;
};

TEST_F(LocalVaultArchiveStoreTest, CoordinatorUpload_StoresIdenticalBytes)
{
    // Arrange
    const std::vector<unsigned char> content = PatternBytes(2 * 1024 * 1024 + 12345, 3);
    const fs::path sourceFile = testDir / "source.bin";
    WriteBinaryFile(sourceFile, content);
    UploadOptions options;
    options.partSize = 1024 * 1024;
    UploadCoordinator coordinator(*vault, options);

    // Act
    std::string archiveId;
    const UploadStatus status = coordinator.Upload(sourceFile, "source.bin", archiveId);

    // Assert
    ASSERT_EQ(UploadStatus::Completed, status);
    EXPECT_EQ(content, ReadBinaryFile(vault->ArchivePath(archiveId)));
    EXPECT_TRUE(fs::exists(vault->ArchivePath(archiveId).string() + ".desc"));
    EXPECT_TRUE(fs::is_empty(testDir / "vault" / "sessions"));
}

TEST_F(LocalVaultArchiveStoreTest, CoordinatorUpload_EmptyFile_StoresEmptyArchive)
{
    const fs::path sourceFile = testDir / "empty.bin";
    WriteBinaryFile(sourceFile, {});
    UploadCoordinator coordinator(*vault, UploadOptions{});

    std::string archiveId;
    ASSERT_EQ(UploadStatus::Completed, coordinator.Upload(sourceFile, "empty.bin", archiveId));

    EXPECT_EQ(0u, fs::file_size(vault->ArchivePath(archiveId)));
}

TEST_F(LocalVaultArchiveStoreTest, UploadPart_WrongChecksum_IsRejected)
{
    // Arrange
    const std::string sessionId = vault->InitiateSession("bad", 1024 * 1024);
    const std::vector<unsigned char> body = PatternBytes(100);
    const std::vector<unsigned char> other = PatternBytes(100, 99);

    // Act / Assert
    EXPECT_THROW(vault->UploadPart(sessionId, FormatByteRange(0, body.size()), TreeHasher::ToHex(hasher.PartChecksum(other)), body),
                 ArchiveStoreError);
}

TEST_F(LocalVaultArchiveStoreTest, UploadPart_RangeNotMatchingBody_IsRejected)
{
    const std::string sessionId = vault->InitiateSession("bad", 1024 * 1024);
    const std::vector<unsigned char> body = PatternBytes(100);

    EXPECT_THROW(vault->UploadPart(sessionId, "bytes 0-49/*", TreeHasher::ToHex(hasher.PartChecksum(body)), body), ArchiveStoreError);
    EXPECT_THROW(vault->UploadPart(sessionId, "0-99", TreeHasher::ToHex(hasher.PartChecksum(body)), body), ArchiveStoreError);
}

TEST_F(LocalVaultArchiveStoreTest, CompleteSession_MissingPart_IsRejected)
{
    // Arrange: only the second of two parts arrives
    const std::uint64_t partSize = 1024 * 1024;
    const std::string sessionId = vault->InitiateSession("gap", partSize);
    const std::vector<unsigned char> body = PatternBytes(10);
    const Digest checksum = hasher.PartChecksum(body);
    vault->UploadPart(sessionId, FormatByteRange(partSize, body.size()), TreeHasher::ToHex(checksum), body);

    // Act / Assert
    EXPECT_THROW(vault->CompleteSession(sessionId, partSize + body.size(), TreeHasher::ToHex(checksum)), ArchiveStoreError);
}

TEST_F(LocalVaultArchiveStoreTest, CompleteSession_WrongFinalChecksum_IsRejected)
{
    const std::string sessionId = vault->InitiateSession("wrong", 1024 * 1024);
    const std::vector<unsigned char> body = PatternBytes(10);
    vault->UploadPart(sessionId, FormatByteRange(0, body.size()), TreeHasher::ToHex(hasher.PartChecksum(body)), body);

    const std::vector<unsigned char> other = PatternBytes(10, 5);
    EXPECT_THROW(vault->CompleteSession(sessionId, body.size(), TreeHasher::ToHex(hasher.PartChecksum(other))), ArchiveStoreError);
}

TEST_F(LocalVaultArchiveStoreTest, AbortSession_RemovesSessionAndForgetsIt)
{
    // Arrange
    const std::string sessionId = vault->InitiateSession("aborted", 1024 * 1024);
    ASSERT_TRUE(fs::exists(testDir / "vault" / "sessions" / sessionId));

    // Act
    vault->AbortSession(sessionId);

    // Assert
    EXPECT_FALSE(fs::exists(testDir / "vault" / "sessions" / sessionId));
    EXPECT_THROW(vault->AbortSession(sessionId), ArchiveStoreError);
}

TEST_F(LocalVaultArchiveStoreTest, InitiateSession_InvalidPartSize_IsRejected)
{
    EXPECT_THROW(vault->InitiateSession("odd", 3 * 1024 * 1024), ArchiveStoreError);
    EXPECT_THROW(vault->InitiateSession("small", 4096), ArchiveStoreError);
}

TEST(ByteRangeTest, FormatAndParse)
{
    std::uint64_t first = 0;
    std::uint64_t last = 0;

    EXPECT_EQ("bytes 0-4194303/*", FormatByteRange(0, 4 * 1024 * 1024));
    EXPECT_EQ("bytes 0-0/*", FormatByteRange(0, 0));
    ASSERT_TRUE(ParseByteRange("bytes 4194304-8388607/*", first, last));
    EXPECT_EQ(4194304u, first);
    EXPECT_EQ(8388607u, last);
    EXPECT_FALSE(ParseByteRange("bytes 9-3/*", first, last));
    EXPECT_FALSE(ParseByteRange("bytes x-3/*", first, last));
}

TEST(PartSizeValidationTest, PowersOfTwoMiBUpToFourGiB)
{
    EXPECT_TRUE(IsValidPartSize(1024 * 1024));
    EXPECT_TRUE(IsValidPartSize(4 * 1024 * 1024));
    EXPECT_TRUE(IsValidPartSize(MaximumPartSize));
    EXPECT_FALSE(IsValidPartSize(0));
    EXPECT_FALSE(IsValidPartSize(6 * 1024 * 1024));
    EXPECT_FALSE(IsValidPartSize(2 * MaximumPartSize));
}
