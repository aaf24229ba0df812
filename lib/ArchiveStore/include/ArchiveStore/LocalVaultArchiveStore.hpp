#pragma once

#include "ArchiveStore/ArchiveStore.hpp"
#include "TreeHasher/TreeHasher.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fs = std::filesystem;

/**
 * @brief Archive store keeping its vault in a local directory.
 *
 * Parts are verified against their tree hash on receipt and kept under
 * sessions/<sessionId>/. Completing a session checks contiguity, size and the
 * archive tree hash, then writes archives/<archiveId> and archives/<archiveId>.desc.
 * Session bookkeeping lives in memory only.
 */
class LocalVaultArchiveStore : public ArchiveStore
{
  public:
    /**
     * @brief Open or create a vault directory.
     *
     * @param[in] vaultDirectory Root directory of the vault
     */
    explicit LocalVaultArchiveStore(const fs::path& vaultDirectory);

    std::string InitiateSession(const std::string& description, std::uint64_t partSizeBytes) override;
    void UploadPart(const std::string& sessionId, const std::string& byteRange, const std::string& checksumHex,
                    const std::vector<unsigned char>& body) override;
    std::string CompleteSession(const std::string& sessionId, std::uint64_t totalSizeBytes, const std::string& finalChecksumHex) override;
    void AbortSession(const std::string& sessionId) override;

    /**
     * @brief Location of a completed archive inside the vault.
     */
    fs::path ArchivePath(const std::string& archiveId) const;

  private:
    struct UploadedPart
    {
        std::uint64_t length;
        Digest checksum;
    };

    struct Session
    {
        std::string description;
        std::uint64_t partSize;
        fs::path directory;
        std::map<std::uint64_t, UploadedPart> parts; /**< Keyed by first byte */
    };

    Session& FindSession(const std::string& sessionId);
    std::string AssembleArchive(const Session& session, const std::string& sessionId);

    fs::path _vaultDirectory;
    fs::path _sessionsDirectory;
    fs::path _archivesDirectory;
    TreeHasher _treeHasher;
    std::atomic<std::uint64_t> _sessionCounter;
    std::mutex _sessionsMutex;
    std::unordered_map<std::string, Session> _sessions;
};
