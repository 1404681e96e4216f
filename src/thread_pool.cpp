#include "mediagate/thread_pool.hpp"

#include "mediagate/log.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace mediagate {

ThreadPool::ThreadPool(std::size_t thread_count) {
    if (thread_count == 0) {
        throw std::invalid_argument("thread pool needs at least one worker");
    }
    workers_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
}

ThreadPool::~ThreadPool() { shutdown(); }

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ && workers_.empty()) {
            return;
        }
        stop_ = true;
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void ThreadPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("thread pool is shutting down");
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
}

std::size_t ThreadPool::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

std::size_t ThreadPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++busy_;
        }

        // Failures normally travel through the task's future.
        try {
            task();
        } catch (const std::exception& ex) {
            logger()->error("unhandled exception in pool worker: {}", ex.what());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        --busy_;
    }
}

} // namespace mediagate
