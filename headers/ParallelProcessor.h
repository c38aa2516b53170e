#pragma once
#include <algorithm>
#include <chrono>
#include <future>
#include <iterator>
#include <thread>
#include <vector>

/**
 * small fork/join helper for running independent comparison jobs on several
 * cores. each job must only read shared data (the GridGraph is immutable so
 * any number of searches can run over it at once)
 */
class ParallelProcessor
{
public:
    // 0 = pick from hardware_concurrency
    ParallelProcessor(size_t numThreads = 0);
    ~ParallelProcessor() = default;

    // static chunks, one per thread. exceptions thrown by func resurface here
    template <typename Container, typename Function>
    void parallelFor(Container &container, Function &&func)
    {
        const size_t totalWork = container.size();
        if (totalWork == 0)
            return;

        auto startTime = std::chrono::high_resolution_clock::now();

        if (numThreads_ <= 1 || totalWork == 1)
        {
            // not worth the thread spin up
            for (auto &item : container)
                func(item);
        }
        else
        {
            const size_t chunkSize = calculateChunkSize(totalWork);
            std::vector<std::future<void>> futures;
            futures.reserve(numThreads_);

            for (size_t threadId = 0; threadId < numThreads_; ++threadId)
            {
                size_t start = threadId * chunkSize;
                size_t end = std::min(start + chunkSize, totalWork);
                if (start >= totalWork)
                    break;

                futures.emplace_back(std::async(std::launch::async, [&container, &func, start, end]()
                                                {
                    auto it = std::next(std::begin(container), start);
                    for (size_t i = start; i < end; ++i, ++it) {
                        func(*it);
                    } }));
            }

            // get() instead of wait() so a failing job is not silently dropped
            for (auto &future : futures)
                future.get();
        }

        auto endTime = std::chrono::high_resolution_clock::now();
        recordRun(std::chrono::duration<double, std::milli>(endTime - startTime).count());
    }

    size_t getThreadCount() const { return numThreads_; }

    // performance monitoring
    struct PerformanceMetrics
    {
        double avgExecutionTime = 0.0;
        double maxExecutionTime = 0.0;
        double minExecutionTime = 0.0;
        size_t totalOperations = 0;
    };

    PerformanceMetrics getMetrics() const { return metrics_; }
    void resetMetrics() { metrics_ = PerformanceMetrics{}; }

private:
    size_t numThreads_;
    PerformanceMetrics metrics_;

    static size_t getOptimalThreadCount();
    size_t calculateChunkSize(size_t totalWork) const;
    void recordRun(double durationMs);
};
