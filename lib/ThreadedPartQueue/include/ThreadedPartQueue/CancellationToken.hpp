#pragma once

#include <atomic>

/**
 * @brief Cooperative cancellation flag shared by the workers of one job.
 */
class CancellationToken
{
  public:
    CancellationToken() : _cancelled(false)
    {
    }

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void Cancel()
    {
        _cancelled.store(true);
    }

    bool IsCancelled() const
    {
        return _cancelled.load();
    }

  private:
    std::atomic<bool> _cancelled;
};
