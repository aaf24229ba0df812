#include "UploadCoordinator/UploadCoordinator.hpp"

#include "ThreadedPartQueue/CancellationToken.hpp"
#include "ThreadedPartQueue/ThreadedPartQueue.hpp"
#include "UploadCoordinator/PartResultChannel.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

namespace
{
constexpr std::uint64_t FirstRaisedPartSize = 8 * MinimumPartSize;
}

const char* UploadStateToString(UploadState state)
{
    switch (state)
    {
    case UploadState::Created:
        return "Created";
    case UploadState::PartsInFlight:
        return "PartsInFlight";
    case UploadState::Completing:
        return "Completing";
    case UploadState::Completed:
        return "Completed";
    case UploadState::Aborting:
        return "Aborting";
    case UploadState::Failed:
        return "Failed";
    }
    return "Unknown";
}

bool ChoosePartSize(std::uint64_t fileSize, std::uint64_t preferredPartSize, std::uint64_t& outputPartSize)
{
    if (fileSize <= preferredPartSize * MaximumPartCount)
    {
        outputPartSize = preferredPartSize;
        return true;
    }
    if (fileSize > MaximumPartSize * MaximumPartCount)
    {
        return false;
    }

    const std::uint64_t minimumPartSize = (fileSize + MaximumPartCount - 1) / MaximumPartCount;
    std::uint64_t partSize = FirstRaisedPartSize;
    while (partSize < minimumPartSize)
    {
        partSize *= 2;
    }
    outputPartSize = partSize;
    return true;
}

std::size_t PartCountFor(std::uint64_t fileSize, std::uint64_t partSize)
{
    if (0 == fileSize)
    {
        return 1;
    }
    return static_cast<std::size_t>((fileSize + partSize - 1) / partSize);
}

UploadCoordinator::UploadCoordinator(ArchiveStore& archiveStore, const UploadOptions& options)
    : _archiveStore(archiveStore), _options(options)
{
    if (false == IsValidPartSize(_options.partSize))
    {
        throw std::invalid_argument("Part size must be 1 MiB times a power of two, got " + std::to_string(_options.partSize));
    }
    if (0 == _options.concurrentUploads)
    {
        throw std::invalid_argument("At least one concurrent upload is required.");
    }
}

UploadStatus UploadCoordinator::Upload(const fs::path& filePath, const std::string& description, std::string& outputArchiveId)
{
    UploadJob job;
    job.sourcePath = filePath;

    std::error_code errorCode;
    job.fileSize = fs::file_size(filePath, errorCode);
    if (0 != errorCode.value())
    {
        spdlog::error("cannot stat {}: {}", filePath.string(), errorCode.message());
        return UploadStatus::SourceUnreadable;
    }
    if (false == ChoosePartSize(job.fileSize, _options.partSize, job.partSize))
    {
        spdlog::error("{} is too large to upload ({} bytes)", filePath.string(), job.fileSize);
        return UploadStatus::SourceTooLarge;
    }
    job.totalParts = PartCountFor(job.fileSize, job.partSize);

    try
    {
        job.sessionId = _archiveStore.InitiateSession(description, job.partSize);
    }
    catch (const ArchiveStoreError& error)
    {
        spdlog::error("failed to create upload for {}: {}", filePath.string(), error.what());
        return UploadStatus::SessionInitiateFailed;
    }
    spdlog::info("created upload {} for file {}. uploading {} parts", job.sessionId, filePath.string(), job.totalParts);

    try
    {
        return TransferAndComplete(job, outputArchiveId);
    }
    catch (const std::system_error& error)
    {
        spdlog::error("upload {} interrupted: {}", job.sessionId, error.what());
        if ((UploadState::Aborting == job.state) || (UploadState::Failed == job.state))
        {
            Transition(job, UploadState::Failed);
            return UploadStatus::SystemFault;
        }
        return Abort(job, UploadStatus::SystemFault);
    }
}

/**
 * @brief Upload all parts of an open session and complete it.
 *
 * @throws std::system_error if a worker thread cannot be started
 */
UploadStatus UploadCoordinator::TransferAndComplete(UploadJob& job, std::string& outputArchiveId)
{
    PartResultChannel results(job.totalParts);
    CancellationToken cancellation;
    Transition(job, UploadState::PartsInFlight);
    {
        ThreadedPartQueue workers(_options.concurrentUploads, job.totalParts, cancellation,
                                  [&](std::size_t offset) { return UploadPart(job, results, offset); });
        workers.Finalize();
    }

    if (true == cancellation.IsCancelled())
    {
        return Abort(job, UploadStatus::PartUploadFailed);
    }

    std::vector<Digest> partChecksums;
    if (false == results.Collect(partChecksums))
    {
        spdlog::error("error uploading parts: missing hash in result ({} of {} parts)", results.PublishedCount(), job.totalParts);
        return Abort(job, UploadStatus::MissingPartChecksum);
    }

    Transition(job, UploadState::Completing);
    const std::string finalChecksum = TreeHasher::ToHex(_treeHasher.TreeHash(partChecksums));
    spdlog::info("completing upload {}", job.sessionId);
    try
    {
        outputArchiveId = _archiveStore.CompleteSession(job.sessionId, job.fileSize, finalChecksum);
    }
    catch (const ArchiveStoreError& error)
    {
        spdlog::error("error completing upload {}: {}", job.sessionId, error.what());
        return Abort(job, UploadStatus::CompleteFailed);
    }

    Transition(job, UploadState::Completed);
    return UploadStatus::Completed;
}

/**
 * @brief Read, hash and upload the part at an offset. Runs on a worker thread.
 *
 * @return false on any failure, which cancels the job
 */
bool UploadCoordinator::UploadPart(const UploadJob& job, PartResultChannel& results, std::size_t offset)
{
    spdlog::debug("uploading part {} of {}", offset, job.sessionId);
    try
    {
        std::vector<unsigned char> body;
        if (false == ReadPart(job, offset, body))
        {
            spdlog::error("failed to read part {} of {}", offset, job.sourcePath.string());
            return false;
        }

        const Digest checksum = _treeHasher.PartChecksum(body);
        const std::uint64_t firstByte = static_cast<std::uint64_t>(offset) * job.partSize;
        _archiveStore.UploadPart(job.sessionId, FormatByteRange(firstByte, body.size()), TreeHasher::ToHex(checksum), body);

        if (false == results.Publish(offset, checksum))
        {
            spdlog::error("part {} of {} was reported twice", offset, job.sessionId);
            return false;
        }
        return true;
    }
    catch (const std::exception& error)
    {
        spdlog::error("failed to upload part {} of {}: {}", offset, job.sessionId, error.what());
        return false;
    }
}

/**
 * @brief Read one part through a private file handle.
 */
bool UploadCoordinator::ReadPart(const UploadJob& job, std::size_t offset, std::vector<unsigned char>& outputBody) const
{
    const std::uint64_t firstByte = static_cast<std::uint64_t>(offset) * job.partSize;
    const std::uint64_t expectedLength = (firstByte < job.fileSize) ? std::min(job.partSize, job.fileSize - firstByte) : 0;

    std::ifstream inputStream(job.sourcePath, std::ios::binary);
    if (false == inputStream.is_open())
    {
        return false;
    }

    outputBody.resize(static_cast<std::size_t>(expectedLength));
    if (0 == expectedLength)
    {
        return true;
    }

    inputStream.seekg(static_cast<std::streamoff>(firstByte));
    inputStream.read(reinterpret_cast<char*>(outputBody.data()), static_cast<std::streamsize>(expectedLength));
    return static_cast<std::streamsize>(expectedLength) == inputStream.gcount();
}

UploadStatus UploadCoordinator::Abort(UploadJob& job, UploadStatus reason)
{
    Transition(job, UploadState::Aborting);
    try
    {
        _archiveStore.AbortSession(job.sessionId);
    }
    catch (const ArchiveStoreError& error)
    {
        spdlog::warn("failed to abort upload {}: {}", job.sessionId, error.what());
    }
    Transition(job, UploadState::Failed);
    spdlog::error("upload of {} failed: {}", job.sourcePath.string(), UploadStatusToString(reason));
    return reason;
}

void UploadCoordinator::Transition(UploadJob& job, UploadState state) const
{
    spdlog::debug("upload {}: {} -> {}", job.sessionId, UploadStateToString(job.state), UploadStateToString(state));
    job.state = state;
}
