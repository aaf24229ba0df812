#include "ArchiveStore/LocalVaultArchiveStore.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>
#include <xxhash.h>

namespace
{
constexpr std::size_t AssembleBufferSize = 1024 * 1024;

std::string FormatHash64(XXH64_hash_t hashValue)
{
    std::ostringstream outputStream;
    outputStream << std::hex << std::setw(16) << std::setfill('0') << hashValue;
    return outputStream.str();
}

fs::path PartFileName(const fs::path& directory, std::uint64_t firstByte)
{
    return directory / (std::to_string(firstByte) + ".part");
}

void WriteFileAtomically(const fs::path& target, const unsigned char* data, std::size_t size)
{
    const fs::path temporary = target.string() + ".tmp";
    {
        std::ofstream outputStream(temporary, std::ios::binary | std::ios::trunc);
        if (false == outputStream.is_open())
        {
            throw ArchiveStoreError("cannot create " + temporary.string());
        }
        outputStream.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        outputStream.flush();
        if (false == outputStream.good())
        {
            throw ArchiveStoreError("cannot write " + temporary.string());
        }
    }

    std::error_code errorCode;
    fs::rename(temporary, target, errorCode);
    if (0 != errorCode.value())
    {
        throw ArchiveStoreError("cannot rename " + temporary.string() + ": " + errorCode.message());
    }
}
}

LocalVaultArchiveStore::LocalVaultArchiveStore(const fs::path& vaultDirectory)
    : _vaultDirectory(vaultDirectory), _sessionsDirectory(vaultDirectory / "sessions"), _archivesDirectory(vaultDirectory / "archives"),
      _sessionCounter(0)
{
    std::error_code errorCode;
    fs::create_directories(_sessionsDirectory, errorCode);
    if (0 == errorCode.value())
    {
        fs::create_directories(_archivesDirectory, errorCode);
    }
    if (0 != errorCode.value())
    {
        throw ArchiveStoreError("cannot create vault at " + _vaultDirectory.string() + ": " + errorCode.message());
    }
}

std::string LocalVaultArchiveStore::InitiateSession(const std::string& description, std::uint64_t partSizeBytes)
{
    if (false == IsValidPartSize(partSizeBytes))
    {
        throw ArchiveStoreError("invalid part size " + std::to_string(partSizeBytes));
    }

    const auto now = std::chrono::system_clock::now().time_since_epoch().count();
    const std::string seedText = description + "/" + std::to_string(now) + "/" + std::to_string(++_sessionCounter);
    const std::string sessionId = FormatHash64(XXH64(seedText.data(), seedText.size(), 0));

    const fs::path directory = _sessionsDirectory / sessionId;
    std::error_code errorCode;
    fs::create_directories(directory, errorCode);
    if (0 != errorCode.value())
    {
        throw ArchiveStoreError("cannot create session directory " + directory.string() + ": " + errorCode.message());
    }

    std::lock_guard lock(_sessionsMutex);
    _sessions[sessionId] = Session{description, partSizeBytes, directory, {}};
    return sessionId;
}

void LocalVaultArchiveStore::UploadPart(const std::string& sessionId, const std::string& byteRange, const std::string& checksumHex,
                                        const std::vector<unsigned char>& body)
{
    std::uint64_t firstByte = 0;
    std::uint64_t lastByte = 0;
    if (false == ParseByteRange(byteRange, firstByte, lastByte))
    {
        throw ArchiveStoreError("malformed range '" + byteRange + "'");
    }

    const std::uint64_t length = body.size();
    const bool rangeMatchesBody = (0 == length) ? (firstByte == lastByte) : (lastByte - firstByte + 1 == length);
    if (false == rangeMatchesBody)
    {
        throw ArchiveStoreError("range '" + byteRange + "' does not match body of " + std::to_string(length) + " bytes");
    }

    fs::path directory;
    {
        std::lock_guard lock(_sessionsMutex);
        Session& session = FindSession(sessionId);
        if ((0 != firstByte % session.partSize) || (length > session.partSize))
        {
            throw ArchiveStoreError("range '" + byteRange + "' is not aligned to part size " + std::to_string(session.partSize));
        }
        directory = session.directory;
    }

    const Digest checksum = _treeHasher.PartChecksum(body);
    if (TreeHasher::ToHex(checksum) != checksumHex)
    {
        throw ArchiveStoreError("checksum mismatch for range '" + byteRange + "'");
    }

    WriteFileAtomically(PartFileName(directory, firstByte), body.data(), body.size());

    std::lock_guard lock(_sessionsMutex);
    FindSession(sessionId).parts[firstByte] = UploadedPart{length, checksum};
}

std::string LocalVaultArchiveStore::CompleteSession(const std::string& sessionId, std::uint64_t totalSizeBytes,
                                                    const std::string& finalChecksumHex)
{
    Session session;
    {
        std::lock_guard lock(_sessionsMutex);
        session = FindSession(sessionId);
    }

    if (true == session.parts.empty())
    {
        throw ArchiveStoreError("session " + sessionId + " has no parts");
    }

    std::uint64_t expectedFirstByte = 0;
    std::vector<Digest> partChecksums;
    for (const auto& [firstByte, part] : session.parts)
    {
        if (firstByte != expectedFirstByte)
        {
            throw ArchiveStoreError("session " + sessionId + " is missing data at byte " + std::to_string(expectedFirstByte));
        }
        const bool isLast = (firstByte + part.length >= totalSizeBytes);
        if ((false == isLast) && (part.length != session.partSize))
        {
            throw ArchiveStoreError("short part at byte " + std::to_string(firstByte));
        }
        partChecksums.push_back(part.checksum);
        expectedFirstByte += part.length;
        if (true == isLast)
        {
            break;
        }
    }

    if ((expectedFirstByte != totalSizeBytes) || (partChecksums.size() != session.parts.size()))
    {
        throw ArchiveStoreError("uploaded parts do not add up to " + std::to_string(totalSizeBytes) + " bytes");
    }
    if (TreeHasher::ToHex(_treeHasher.TreeHash(partChecksums)) != finalChecksumHex)
    {
        throw ArchiveStoreError("archive checksum mismatch for session " + sessionId);
    }

    const std::string archiveId = AssembleArchive(session, sessionId);

    std::error_code errorCode;
    fs::remove_all(session.directory, errorCode);
    {
        std::lock_guard lock(_sessionsMutex);
        _sessions.erase(sessionId);
    }
    return archiveId;
}

void LocalVaultArchiveStore::AbortSession(const std::string& sessionId)
{
    fs::path directory;
    {
        std::lock_guard lock(_sessionsMutex);
        directory = FindSession(sessionId).directory;
        _sessions.erase(sessionId);
    }

    std::error_code errorCode;
    fs::remove_all(directory, errorCode);
    if (0 != errorCode.value())
    {
        throw ArchiveStoreError("cannot remove session directory " + directory.string() + ": " + errorCode.message());
    }
}

fs::path LocalVaultArchiveStore::ArchivePath(const std::string& archiveId) const
{
    return _archivesDirectory / archiveId;
}

/**
 * @brief Look up an open session. Caller holds _sessionsMutex.
 */
LocalVaultArchiveStore::Session& LocalVaultArchiveStore::FindSession(const std::string& sessionId)
{
    auto iterator = _sessions.find(sessionId);
    if (_sessions.end() == iterator)
    {
        throw ArchiveStoreError("unknown session " + sessionId);
    }
    return iterator->second;
}

/**
 * @brief Concatenate the parts of a verified session into the archives directory.
 *
 * @return Archive identifier, the content XXH64 joined with the session id
 */
std::string LocalVaultArchiveStore::AssembleArchive(const Session& session, const std::string& sessionId)
{
    const fs::path assembling = _archivesDirectory / (sessionId + ".assembling");
    std::ofstream outputStream(assembling, std::ios::binary | std::ios::trunc);
    if (false == outputStream.is_open())
    {
        throw ArchiveStoreError("cannot create " + assembling.string());
    }

    XXH64_state_t* hashState = XXH64_createState();
    if (nullptr == hashState)
    {
        throw ArchiveStoreError("cannot allocate archive hash state");
    }
    XXH64_reset(hashState, 0);

    std::vector<char> buffer(AssembleBufferSize);
    for (const auto& [firstByte, part] : session.parts)
    {
        std::ifstream inputStream(PartFileName(session.directory, firstByte), std::ios::binary);
        if (false == inputStream.is_open())
        {
            XXH64_freeState(hashState);
            throw ArchiveStoreError("part at byte " + std::to_string(firstByte) + " vanished");
        }
        while (true)
        {
            inputStream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const std::streamsize bytesRead = inputStream.gcount();
            if (0 >= bytesRead)
            {
                break;
            }
            XXH64_update(hashState, buffer.data(), static_cast<size_t>(bytesRead));
            outputStream.write(buffer.data(), bytesRead);
        }
    }

    const std::string archiveId = FormatHash64(XXH64_digest(hashState)) + "-" + sessionId;
    XXH64_freeState(hashState);

    outputStream.flush();
    if (false == outputStream.good())
    {
        throw ArchiveStoreError("cannot write " + assembling.string());
    }
    outputStream.close();

    std::error_code errorCode;
    fs::rename(assembling, ArchivePath(archiveId), errorCode);
    if (0 != errorCode.value())
    {
        throw ArchiveStoreError("cannot store archive " + archiveId + ": " + errorCode.message());
    }

    const fs::path descriptionFile = ArchivePath(archiveId).string() + ".desc";
    WriteFileAtomically(descriptionFile, reinterpret_cast<const unsigned char*>(session.description.data()), session.description.size());

    spdlog::debug("vault stored archive {} ({})", archiveId, session.description);
    return archiveId;
}
