#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace compute {

// Пул рабочих потоков для параллельного вычисления пакета выражений.
// Потоки создаются один раз и обрабатывают пакеты индексов: каждый поток
// забирает следующий свободный индекс, пока индексы пакета не кончатся.
class ThreadPool {
public:
    // threadCount == 0 трактуется как 1
    explicit ThreadPool(std::size_t threadCount);

    // Останавливает потоки; вызывается, когда пакет уже не выполняется
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Вызывает task(i) ровно один раз для каждого i из [0, count) и возвращается,
    // когда все вызовы завершены. Исключение задачи не прерывает остальные индексы:
    // первое из них пробрасывается вызывающему после завершения пакета.
    void forEachIndex(std::size_t count, const std::function<void(std::size_t)>& task);

    std::size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;

    std::mutex batchMutex; // Пакеты выполняются по одному
    std::mutex mutex;
    std::condition_variable wakeup;
    std::condition_variable finished;

    const std::function<void(std::size_t)>* current = nullptr;
    std::size_t total = 0;
    std::atomic<std::size_t> nextIndex{0};
    std::size_t generation = 0;
    std::size_t activeWorkers = 0;
    std::exception_ptr firstError;
    bool stopping = false;

    void workerLoop();
    void runIndices(const std::function<void(std::size_t)>& task, std::size_t count);
};

} // namespace compute
