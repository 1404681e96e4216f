#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mediagate {

// Fixed-size pool. The destructor drains queued tasks and joins every worker,
// so it blocks until running work returns on its own.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t thread_count);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::runtime_error once the pool is shutting down.
    void submit(std::function<void()> task);

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }
    [[nodiscard]] std::size_t busy() const;
    [[nodiscard]] std::size_t queued() const;

    void shutdown();

private:
    void workerLoop();

    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::vector<std::thread> workers_;
    std::size_t busy_{0};
    bool stop_{false};
};

} // namespace mediagate
