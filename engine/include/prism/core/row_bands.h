#pragma once

#include <prism/core/log.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace prism
{

// Splits [0, rowCount) into contiguous bands, one per worker, and runs
// work(startRow, endRow) on each. spawn(task) must return a started
// std::thread. If a worker cannot be started, the rows not yet handed out
// run on the calling thread. Every started worker is joined before return.
template <typename Work, typename Spawn>
void dispatchRowBands(uint32_t rowCount, uint32_t threadCount, Work&& work, Spawn&& spawn)
{
    threadCount = std::min(threadCount, rowCount);
    if (threadCount == 0)
        return;

    std::vector<std::thread> threads;
    threads.reserve(threadCount);

    uint32_t rowsPerThread = rowCount / threadCount;
    uint32_t remainder = rowCount % threadCount;

    uint32_t startRow = 0;
    try
    {
        for (uint32_t i = 0; i < threadCount; ++i)
        {
            uint32_t endRow = startRow + rowsPerThread + (i < remainder ? 1 : 0);
            threads.push_back(spawn([&work, startRow, endRow]() { work(startRow, endRow); }));
            startRow = endRow;
        }
    }
    catch (const std::system_error& e)
    {
        Log::warn("Started " + std::to_string(threads.size()) + " of " + std::to_string(threadCount)
                  + " render threads (" + e.what() + "); tracing remaining rows inline");
        work(startRow, rowCount);
    }
    catch (...)
    {
        for (auto& t : threads)
            t.join();
        throw;
    }

    for (auto& t : threads)
        t.join();
}

template <typename Work>
void dispatchRowBands(uint32_t rowCount, uint32_t threadCount, Work&& work)
{
    dispatchRowBands(rowCount, threadCount, std::forward<Work>(work),
                     [](auto&& task) { return std::thread(std::forward<decltype(task)>(task)); });
}

} // namespace prism
