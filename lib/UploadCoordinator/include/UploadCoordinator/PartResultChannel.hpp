#pragma once

#include "TreeHasher/TreeHasher.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

/**
 * @brief Thread-safe collection of part checksums indexed by part offset.
 *
 * Each slot is written at most once.
 */
class PartResultChannel
{
  public:
    explicit PartResultChannel(std::size_t partCount);

    /**
     * @brief Store the checksum of one part.
     *
     * @param[in] offset Part offset
     * @param[in] checksum Part checksum
     * @return false if the offset is out of range or already published
     */
    bool Publish(std::size_t offset, const Digest& checksum);

    /**
     * @brief Copy out all checksums in offset order.
     *
     * @param[out] outputChecksums Checksums ordered by offset
     * @return false if any slot is still empty
     */
    bool Collect(std::vector<Digest>& outputChecksums) const;

    std::size_t PublishedCount() const;

  private:
    mutable std::mutex _resultsMutex;
    std::vector<std::optional<Digest>> _slots;
    std::size_t _published;
};
