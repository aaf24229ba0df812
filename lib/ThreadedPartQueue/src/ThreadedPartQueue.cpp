#include "ThreadedPartQueue/ThreadedPartQueue.hpp"

#include <algorithm>
#include <system_error>

ThreadedPartQueue::ThreadedPartQueue(unsigned int threadCount, std::size_t partCount, CancellationToken& cancellation,
                                     const std::function<bool(std::size_t)>& workItem)
    : _cancellation(cancellation), _workItem(workItem), _finalized(false)
{
    for (std::size_t offset = 0; offset < partCount; ++offset)
    {
        _partQueue.push(offset);
    }

    const std::size_t workerCount = std::max<std::size_t>(1, std::min<std::size_t>(threadCount, partCount));
    _workers.reserve(workerCount);
    try
    {
        for (std::size_t i = 0; i < workerCount; ++i)
        {
            _workers.emplace_back([this]() { WorkerLoop(); });
        }
    }
    catch (const std::system_error&)
    {
        _cancellation.Cancel();
        Finalize();
        throw;
    }
}

ThreadedPartQueue::~ThreadedPartQueue()
{
    Finalize();
}

void ThreadedPartQueue::Finalize()
{
    if (true == _finalized)
    {
        return;
    }
    _finalized = true;

    for (auto& worker : _workers)
    {
        if (true == worker.joinable())
        {
            worker.join();
        }
    }
}

bool ThreadedPartQueue::TryDequeue(std::size_t& outputOffset)
{
    std::lock_guard lock(_queueMutex);
    if (true == _partQueue.empty())
    {
        return false;
    }
    outputOffset = _partQueue.front();
    _partQueue.pop();
    return true;
}

/**
 * @brief Worker thread loop claiming offsets until the queue drains or the job is cancelled.
 */
void ThreadedPartQueue::WorkerLoop()
{
    while (false == _cancellation.IsCancelled())
    {
        std::size_t offset = 0;
        if (false == TryDequeue(offset))
        {
            return;
        }
        if (false == _workItem(offset))
        {
            _cancellation.Cancel();
            return;
        }
    }
}
