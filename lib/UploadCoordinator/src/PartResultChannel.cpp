#include "UploadCoordinator/PartResultChannel.hpp"

PartResultChannel::PartResultChannel(std::size_t partCount) : _slots(partCount), _published(0)
{
}

bool PartResultChannel::Publish(std::size_t offset, const Digest& checksum)
{
    std::lock_guard lock(_resultsMutex);
    if ((offset >= _slots.size()) || (true == _slots[offset].has_value()))
    {
        return false;
    }
    _slots[offset] = checksum;
    ++_published;
    return true;
}

bool PartResultChannel::Collect(std::vector<Digest>& outputChecksums) const
{
    std::lock_guard lock(_resultsMutex);
    std::vector<Digest> checksums;
    checksums.reserve(_slots.size());
    for (const auto& slot : _slots)
    {
        if (false == slot.has_value())
        {
            return false;
        }
        checksums.push_back(slot.value());
    }
    outputChecksums.swap(checksums);
    return true;
}

std::size_t PartResultChannel::PublishedCount() const
{
    std::lock_guard lock(_resultsMutex);
    return _published;
}
