#pragma once

#include "ArchiveStore/ArchiveStore.hpp"
#include "TreeHasher/TreeHasher.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class CancellationToken;
class PartResultChannel;

constexpr std::uint64_t DefaultPartSize = 4 * MinimumPartSize;
constexpr unsigned int DefaultConcurrentUploads = 5;

/**
 * @brief Result of one multipart upload.
 */
enum class UploadStatus
{
    Completed,              /**< Archive stored, archive id available */
    SourceUnreadable,       /**< Source file size could not be determined */
    SourceTooLarge,         /**< Source file exceeds the maximum archive size */
    SessionInitiateFailed,  /**< The store refused to open a session */
    PartUploadFailed,       /**< Reading, hashing or uploading a part failed */
    MissingPartChecksum,    /**< A part checksum was missing after all workers finished */
    CompleteFailed,         /**< The store rejected the completion request */
    SystemFault             /**< A local resource failure, such as a worker thread that could not start */
};

/**
 * @brief Convert an UploadStatus value to its string representation.
 */
inline const char* UploadStatusToString(UploadStatus status)
{
    switch (status)
    {
    case UploadStatus::Completed:
        return "Completed";
    case UploadStatus::SourceUnreadable:
        return "SourceUnreadable";
    case UploadStatus::SourceTooLarge:
        return "SourceTooLarge";
    case UploadStatus::SessionInitiateFailed:
        return "SessionInitiateFailed";
    case UploadStatus::PartUploadFailed:
        return "PartUploadFailed";
    case UploadStatus::MissingPartChecksum:
        return "MissingPartChecksum";
    case UploadStatus::CompleteFailed:
        return "CompleteFailed";
    case UploadStatus::SystemFault:
        return "SystemFault";
    }
    return "Unknown";
}

/**
 * @brief Lifecycle of an upload job.
 */
enum class UploadState
{
    Created,
    PartsInFlight,
    Completing,
    Completed,
    Aborting,
    Failed
};

const char* UploadStateToString(UploadState state);

/**
 * @brief Tuning parameters for multipart uploads.
 */
struct UploadOptions
{
    std::uint64_t partSize = DefaultPartSize;               /**< Preferred part size, raised for very large files */
    unsigned int concurrentUploads = DefaultConcurrentUploads; /**< Worker threads per upload */
};

/**
 * @brief In-flight state of one upload, owned by the coordinator for its duration.
 */
struct UploadJob
{
    fs::path sourcePath;
    std::uint64_t fileSize = 0;
    std::uint64_t partSize = 0;
    std::size_t totalParts = 0;
    std::string sessionId;
    UploadState state = UploadState::Created;
};

/**
 * @brief Pick the part size for a file.
 *
 * Keeps the preferred size unless the file would need more than MaximumPartCount
 * parts; then picks the smallest power-of-two multiple of 1 MiB, from 8 MiB up,
 * that fits.
 *
 * @param[in] fileSize File size in bytes
 * @param[in] preferredPartSize Preferred part size
 * @param[out] outputPartSize Chosen part size
 * @return false if the file is larger than MaximumPartSize * MaximumPartCount
 */
bool ChoosePartSize(std::uint64_t fileSize, std::uint64_t preferredPartSize, std::uint64_t& outputPartSize);

/**
 * @brief Number of parts for a file, at least one even for an empty file.
 */
std::size_t PartCountFor(std::uint64_t fileSize, std::uint64_t partSize);

/**
 * @brief Application component uploading a file as a concurrent, checksum-verified multipart upload.
 *
 * Parts are read, hashed and uploaded by a pool of workers, one pool per upload.
 * The first failing part cancels the job; the session is then aborted and
 * nothing is retried.
 */
class UploadCoordinator
{
  public:
    /**
     * @brief Construct a coordinator for an archive store.
     *
     * @param[in] archiveStore Archive store receiving the uploads
     * @param[in] options Part size and concurrency
     */
    UploadCoordinator(ArchiveStore& archiveStore, const UploadOptions& options);

    /**
     * @brief Upload one file.
     *
     * @param[in] filePath File to upload
     * @param[in] description Archive description
     * @param[out] outputArchiveId Archive identifier when the upload completed
     * @return UploadStatus::Completed on success, the failure reason otherwise
     */
    UploadStatus Upload(const fs::path& filePath, const std::string& description, std::string& outputArchiveId);

  private:
    UploadStatus TransferAndComplete(UploadJob& job, std::string& outputArchiveId);
    bool UploadPart(const UploadJob& job, PartResultChannel& results, std::size_t offset);
    bool ReadPart(const UploadJob& job, std::size_t offset, std::vector<unsigned char>& outputBody) const;
    UploadStatus Abort(UploadJob& job, UploadStatus reason);
    void Transition(UploadJob& job, UploadState state) const;

    ArchiveStore& _archiveStore;
    UploadOptions _options;
    TreeHasher _treeHasher;
};
