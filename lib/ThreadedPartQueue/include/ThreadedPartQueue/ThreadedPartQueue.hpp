#pragma once

#include "ThreadedPartQueue/CancellationToken.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

/**
 * @brief Fixed pool of worker threads draining a pre-filled queue of part offsets.
 *
 * Workers poll the cancellation token before claiming each offset and exit when
 * the queue is empty or the token is cancelled. A work item that returns false
 * cancels the token and ends its worker. Work items are never retried.
 */
class ThreadedPartQueue
{
  public:
    /**
     * @brief Enqueue offsets 0..partCount-1 and start the workers.
     *
     * @param[in] threadCount Number of worker threads, at least one is started
     * @param[in] partCount Number of offsets to enqueue
     * @param[in] cancellation Token shared by all workers of the job
     * @param[in] workItem Work item callback, returns false on failure
     */
    ThreadedPartQueue(unsigned int threadCount, std::size_t partCount, CancellationToken& cancellation,
                      const std::function<bool(std::size_t)>& workItem);
    /**
     * @brief Join worker threads.
     */
    ~ThreadedPartQueue();

    ThreadedPartQueue(const ThreadedPartQueue&) = delete;
    ThreadedPartQueue& operator=(const ThreadedPartQueue&) = delete;

    /**
     * @brief Wait for every worker to terminate.
     */
    void Finalize();

  private:
    bool TryDequeue(std::size_t& outputOffset);
    void WorkerLoop();

    CancellationToken& _cancellation;
    std::function<bool(std::size_t)> _workItem;
    std::mutex _queueMutex;
    std::queue<std::size_t> _partQueue;
    std::vector<std::thread> _workers;
    bool _finalized;
};
