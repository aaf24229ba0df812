#include "ArchiveStore/ArchiveStore.hpp"

#include <cctype>
#include <cstdint>

namespace
{
constexpr const char* RangePrefix = "bytes ";
constexpr const char* RangeSuffix = "/*";

bool ParseNumber(const std::string& text, std::size_t& position, std::uint64_t& outputValue)
{
    const std::size_t start = position;
    std::uint64_t value = 0;
    while ((position < text.size()) && (0 != std::isdigit(static_cast<unsigned char>(text[position]))))
    {
        const std::uint64_t digit = static_cast<std::uint64_t>(text[position] - '0');
        if (value > (UINT64_MAX - digit) / 10)
        {
            return false;
        }
        value = value * 10 + digit;
        ++position;
    }
    outputValue = value;
    return position > start;
}
}

std::string FormatByteRange(std::uint64_t firstByte, std::uint64_t length)
{
    const std::uint64_t lastByte = (0 == length) ? firstByte : firstByte + length - 1;
    return std::string(RangePrefix) + std::to_string(firstByte) + "-" + std::to_string(lastByte) + RangeSuffix;
}

bool ParseByteRange(const std::string& byteRange, std::uint64_t& outputFirstByte, std::uint64_t& outputLastByte)
{
    const std::string prefix(RangePrefix);
    if (0 != byteRange.compare(0, prefix.size(), prefix))
    {
        return false;
    }

    std::size_t position = prefix.size();
    std::uint64_t firstByte = 0;
    std::uint64_t lastByte = 0;
    if (false == ParseNumber(byteRange, position, firstByte))
    {
        return false;
    }
    if ((position >= byteRange.size()) || ('-' != byteRange[position]))
    {
        return false;
    }
    ++position;
    if (false == ParseNumber(byteRange, position, lastByte))
    {
        return false;
    }
    if ((RangeSuffix != byteRange.substr(position)) || (firstByte > lastByte))
    {
        return false;
    }

    outputFirstByte = firstByte;
    outputLastByte = lastByte;
    return true;
}

bool IsValidPartSize(std::uint64_t partSizeBytes)
{
    if ((MinimumPartSize > partSizeBytes) || (MaximumPartSize < partSizeBytes) || (0 != partSizeBytes % MinimumPartSize))
    {
        return false;
    }
    const std::uint64_t multiple = partSizeBytes / MinimumPartSize;
    return 0 == (multiple & (multiple - 1));
}
