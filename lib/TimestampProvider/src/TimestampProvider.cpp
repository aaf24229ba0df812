#include "TimestampProvider/TimestampProvider.hpp"

#include <ctime>

std::int64_t TimestampProvider::NowEpochSeconds() const
{
    return static_cast<std::int64_t>(std::time(nullptr));
}
