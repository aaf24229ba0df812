#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Raw SHA-256 digest bytes.
 */
using Digest = std::array<unsigned char, 32>;

/**
 * @brief Size of the sub-chunks hashed inside a single part.
 */
constexpr std::size_t TreeHashChunkSize = 1024 * 1024;

/**
 * @brief Infrastructure component computing SHA-256 tree hashes using OpenSSL.
 *
 * A part checksum is the tree hash over the 1 MiB sub-chunk digests of that part.
 * An archive checksum is the tree hash over the part checksums in part order.
 */
class TreeHasher
{
  public:
    /**
     * @brief Compute the SHA-256 digest of a byte range.
     *
     * @param[in] data First byte of the range
     * @param[in] size Number of bytes in the range
     * @return Digest of the range
     */
    Digest Sha256(const unsigned char* data, std::size_t size) const;

    /**
     * @brief Hash each contiguous sub-chunk of the input.
     *
     * An empty input yields exactly one digest, the digest of the empty string.
     *
     * @param[in] bytes Input bytes
     * @param[in] subChunkSize Sub-chunk length, the last sub-chunk may be shorter
     * @return Digests of the sub-chunks in input order
     */
    std::vector<Digest> ChunkDigests(const std::vector<unsigned char>& bytes, std::size_t subChunkSize = TreeHashChunkSize) const;

    /**
     * @brief Reduce digests pairwise, left to right, until one remains.
     *
     * An unpaired digest at the end of a pass is carried forward unchanged.
     *
     * @param[in] digests Non-empty sequence of digests
     * @return Root digest
     */
    Digest TreeHash(const std::vector<Digest>& digests) const;

    /**
     * @brief Compute the checksum of one upload part.
     *
     * @param[in] partBytes Bytes of the part
     * @return Tree hash over the 1 MiB sub-chunk digests of the part
     */
    Digest PartChecksum(const std::vector<unsigned char>& partBytes) const;

    /**
     * @brief Format a digest as lowercase hexadecimal.
     *
     * @param[in] digest Digest to format
     * @return 64 character hex string
     */
    static std::string ToHex(const Digest& digest);
};
