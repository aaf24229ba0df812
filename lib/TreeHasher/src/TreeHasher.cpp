#include "TreeHasher/TreeHasher.hpp"

#include <algorithm>
#include <stdexcept>

#include <openssl/evp.h>

namespace
{
constexpr char HexDigits[] = "0123456789abcdef";
}

Digest TreeHasher::Sha256(const unsigned char* data, std::size_t size) const
{
    Digest digest{};
    unsigned int digestLength = 0;
    if (1 != EVP_Digest(data, size, digest.data(), &digestLength, EVP_sha256(), nullptr))
    {
        throw std::runtime_error("SHA-256 digest computation failed.");
    }
    if (digest.size() != digestLength)
    {
        throw std::runtime_error("Unexpected SHA-256 digest length.");
    }
    return digest;
}

std::vector<Digest> TreeHasher::ChunkDigests(const std::vector<unsigned char>& bytes, std::size_t subChunkSize) const
{
    if (0 == subChunkSize)
    {
        throw std::invalid_argument("Sub-chunk size must be positive.");
    }

    std::vector<Digest> digests;
    if (true == bytes.empty())
    {
        digests.push_back(Sha256(bytes.data(), 0));
        return digests;
    }

    digests.reserve((bytes.size() + subChunkSize - 1) / subChunkSize);
    for (std::size_t start = 0; start < bytes.size(); start += subChunkSize)
    {
        const std::size_t length = std::min(subChunkSize, bytes.size() - start);
        digests.push_back(Sha256(bytes.data() + start, length));
    }
    return digests;
}

Digest TreeHasher::TreeHash(const std::vector<Digest>& digests) const
{
    if (true == digests.empty())
    {
        throw std::invalid_argument("Tree hash requires at least one digest.");
    }

    std::vector<Digest> level = digests;
    while (1 < level.size())
    {
        std::vector<Digest> nextLevel;
        nextLevel.reserve((level.size() + 1) / 2);

        std::size_t index = 0;
        for (; index + 1 < level.size(); index += 2)
        {
            unsigned char joined[2 * sizeof(Digest)];
            std::copy(level[index].begin(), level[index].end(), joined);
            std::copy(level[index + 1].begin(), level[index + 1].end(), joined + sizeof(Digest));
            nextLevel.push_back(Sha256(joined, sizeof(joined)));
        }
        if (index < level.size())
        {
            nextLevel.push_back(level[index]);
        }

        level.swap(nextLevel);
    }
    return level.front();
}

Digest TreeHasher::PartChecksum(const std::vector<unsigned char>& partBytes) const
{
    return TreeHash(ChunkDigests(partBytes, TreeHashChunkSize));
}

std::string TreeHasher::ToHex(const Digest& digest)
{
    std::string hex;
    hex.reserve(2 * digest.size());
    for (unsigned char byte : digest)
    {
        hex.push_back(HexDigits[byte >> 4]);
        hex.push_back(HexDigits[byte & 0x0F]);
    }
    return hex;
}
