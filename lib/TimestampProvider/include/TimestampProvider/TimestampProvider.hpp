#pragma once

#include <cstdint>

/**
 * @brief Infrastructure component providing the current time using C time APIs.
 */
class TimestampProvider
{
  public:
    virtual ~TimestampProvider() = default;

    /**
     * @brief Current time in whole seconds since the Unix epoch.
     */
    virtual std::int64_t NowEpochSeconds() const;
};
