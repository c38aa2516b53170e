#include "ParallelProcessor.h"
#include <iostream>

ParallelProcessor::ParallelProcessor(size_t numThreads)
{
    numThreads_ = (numThreads == 0) ? getOptimalThreadCount() : numThreads;
    std::cout << "[PARALLEL] worker pool sized to " << numThreads_ << " threads" << std::endl;
}

size_t ParallelProcessor::getOptimalThreadCount()
{
    size_t hwThreads = std::thread::hardware_concurrency();
    if (hwThreads == 0)
        hwThreads = 4; // fallback...

    // leave one core for the caller
    return std::max(static_cast<size_t>(1), hwThreads - 1);
}

size_t ParallelProcessor::calculateChunkSize(size_t totalWork) const
{
    // ceil division so the last chunk picks up the remainder
    return (totalWork + numThreads_ - 1) / numThreads_;
}

void ParallelProcessor::recordRun(double durationMs)
{
    metrics_.totalOperations++;
    metrics_.avgExecutionTime = (metrics_.avgExecutionTime * (metrics_.totalOperations - 1) + durationMs) / metrics_.totalOperations;
    metrics_.maxExecutionTime = std::max(metrics_.maxExecutionTime, durationMs);
    metrics_.minExecutionTime = (metrics_.minExecutionTime == 0.0) ? durationMs : std::min(metrics_.minExecutionTime, durationMs);
}
