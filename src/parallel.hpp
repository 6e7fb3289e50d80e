#pragma once

#include <algorithm>
#include <cstddef>
#include <future>
#include <vector>

// Runs task(0) .. task(count - 1) on std::async threads, at most
// maxConcurrency at a time, and returns the results in index order.
// The first exception thrown by a task is rethrown once its batch is collected.
template<typename Result, typename Task>
std::vector<Result> runBatched(size_t count, size_t maxConcurrency, Task task) {
    std::vector<Result> results;
    results.reserve(count);
    if (maxConcurrency == 0) maxConcurrency = 1;

    for (size_t base = 0; base < count; base += maxConcurrency) {
        size_t batchEnd = std::min(count, base + maxConcurrency);

        std::vector<std::future<Result>> futures;
        futures.reserve(batchEnd - base);

        // launch batch
        for (size_t i = base; i < batchEnd; ++i) {
            futures.push_back(std::async(std::launch::async, task, i));
        }

        // collect batch
        for (auto& f : futures) {
            results.push_back(f.get());
        }
    }
    return results;
}
