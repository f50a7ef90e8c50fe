#include "compute/thread_pool.hpp"

#include <utility>

namespace compute {

ThreadPool::ThreadPool(std::size_t threadCount) {
    if (threadCount == 0) {
        threadCount = 1;
    }

    workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        workers.emplace_back([this]() { workerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
    }
    wakeup.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::forEachIndex(std::size_t count, const std::function<void(std::size_t)>& task) {
    if (count == 0) {
        return;
    }

    std::lock_guard<std::mutex> batchLock(batchMutex);
    {
        std::lock_guard<std::mutex> lock(mutex);
        current = &task;
        total = count;
        nextIndex = 0;
        firstError = nullptr;
        activeWorkers = workers.size();
        ++generation;
    }
    wakeup.notify_all();

    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(mutex);
        finished.wait(lock, [this]() { return activeWorkers == 0; });
        current = nullptr;
        error = std::exchange(firstError, nullptr);
    }

    if (error) {
        std::rethrow_exception(error);
    }
}

// Каждый поток участвует в каждом пакете ровно один раз: пакет не завершится,
// пока activeWorkers не опустится до нуля
void ThreadPool::workerLoop() {
    std::size_t seenGeneration = 0;
    while (true) {
        const std::function<void(std::size_t)>* task = nullptr;
        std::size_t count = 0;
        {
            std::unique_lock<std::mutex> lock(mutex);
            wakeup.wait(lock, [this, seenGeneration]() {
                return stopping || generation != seenGeneration;
            });

            if (stopping) {
                return;
            }

            seenGeneration = generation;
            task = current;
            count = total;
        }

        runIndices(*task, count);

        std::lock_guard<std::mutex> lock(mutex);
        if (--activeWorkers == 0) {
            finished.notify_all();
        }
    }
}

void ThreadPool::runIndices(const std::function<void(std::size_t)>& task, std::size_t count) {
    for (std::size_t index = nextIndex.fetch_add(1); index < count; index = nextIndex.fetch_add(1)) {
        try {
            task(index);
        }
        catch (...) {
            // Сохраняется для forEachIndex, остальные индексы продолжают выполняться
            std::lock_guard<std::mutex> lock(mutex);
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }
}

} // namespace compute
