#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace geodata {

/// Fixed set of threads draining a FIFO of tasks. Tasks may run in any
/// order relative to each other once more than one thread is busy.
class WorkerPool {
public:
    explicit WorkerPool(int thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Throws std::logic_error after shutdown().
    void submit(std::function<void()> task);

    /// Run the queued tasks to completion and join every thread.
    void shutdown();

    [[nodiscard]] int thread_count() const noexcept { return thread_count_; }

private:
    void run();

    const int thread_count_;
    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{true};
};

} // namespace geodata
