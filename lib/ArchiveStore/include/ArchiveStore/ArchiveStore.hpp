#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

constexpr std::uint64_t MinimumPartSize = 1024ULL * 1024ULL;
constexpr std::uint64_t MaximumPartSize = 4096ULL * MinimumPartSize;
constexpr std::uint64_t MaximumPartCount = 10000;

/**
 * @brief Raised when the archive store rejects or fails a request.
 */
class ArchiveStoreError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Session based multipart upload protocol of an archive store.
 *
 * Implementations must accept concurrent UploadPart calls for the same session.
 * Every failure is reported by throwing ArchiveStoreError.
 */
class ArchiveStore
{
  public:
    virtual ~ArchiveStore() = default;

    /**
     * @brief Open a multipart upload.
     *
     * @param[in] description Archive description stored with the archive
     * @param[in] partSizeBytes Size of every part except the last
     * @return Session identifier
     */
    virtual std::string InitiateSession(const std::string& description, std::uint64_t partSizeBytes) = 0;

    /**
     * @brief Upload one part of an open session.
     *
     * @param[in] sessionId Session identifier
     * @param[in] byteRange Range of the part within the archive, "bytes A-B/*"
     * @param[in] checksumHex Tree hash of the part in lowercase hex
     * @param[in] body Part bytes
     */
    virtual void UploadPart(const std::string& sessionId, const std::string& byteRange, const std::string& checksumHex,
                            const std::vector<unsigned char>& body) = 0;

    /**
     * @brief Assemble the uploaded parts into an archive.
     *
     * @param[in] sessionId Session identifier
     * @param[in] totalSizeBytes Size of the whole archive
     * @param[in] finalChecksumHex Tree hash over all part checksums in lowercase hex
     * @return Archive identifier
     */
    virtual std::string CompleteSession(const std::string& sessionId, std::uint64_t totalSizeBytes, const std::string& finalChecksumHex) = 0;

    /**
     * @brief Discard an open session and its uploaded parts.
     *
     * @param[in] sessionId Session identifier
     */
    virtual void AbortSession(const std::string& sessionId) = 0;
};

/**
 * @brief Format the byte range of a part as "bytes A-B/*".
 *
 * B is inclusive. A zero-length part is written as "bytes A-A/*".
 *
 * @param[in] firstByte Offset of the first byte
 * @param[in] length Number of bytes in the part
 * @return Range header value
 */
std::string FormatByteRange(std::uint64_t firstByte, std::uint64_t length);

/**
 * @brief Parse a "bytes A-B/*" range header value.
 *
 * @param[in] byteRange Range header value
 * @param[out] outputFirstByte Parsed A
 * @param[out] outputLastByte Parsed B
 * @return true if the value is well formed with A <= B
 */
bool ParseByteRange(const std::string& byteRange, std::uint64_t& outputFirstByte, std::uint64_t& outputLastByte);

/**
 * @brief Check that a part size is 1 MiB times a power of two, at most 4 GiB.
 */
bool IsValidPartSize(std::uint64_t partSizeBytes);
