#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include "../common/logger.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace kott {

/**
 * ThreadPool - Fixed set of request workers sharing one FIFO of tasks
 *
 * Stands in for the request layer: every submitted task is one
 * request against the GameServer, run concurrently with the others.
 */
class ThreadPool {
public:
    using Task = std::function<void()>;

    explicit ThreadPool(size_t numThreads = std::thread::hardware_concurrency())
        : running_(true)
        , pendingTasks_(0)
    {
        if (numThreads == 0) {
            numThreads = 1;
        }
        for (size_t i = 0; i < numThreads; ++i) {
            workers_.emplace_back(&ThreadPool::workerFunction, this);
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a task; ignored once the pool is shut down
     */
    void submit(Task task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            tasks_.push_back(std::move(task));
            pendingTasks_++;
        }
        cv_.notify_one();
    }

    /**
     * Wait until every submitted task, including ones submitted by
     * running tasks, has completed
     */
    void waitAll() {
        std::unique_lock<std::mutex> lock(mutex_);
        idleCv_.wait(lock, [this]() { return pendingTasks_ == 0; });
    }

    /**
     * Finish the task in hand, drop the rest, join the workers
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            running_ = false;
            pendingTasks_ -= tasks_.size();
            tasks_.clear();
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        idleCv_.notify_all();
    }

    size_t numWorkers() const { return workers_.size(); }

    size_t completedCount() const {
        return completed_.load(std::memory_order_relaxed);
    }

private:
    void workerFunction() {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return !running_ || !tasks_.empty(); });
                if (!running_) return;
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }

            try {
                task();
            } catch (const std::exception& e) {
                Logger::error("ThreadPool", "task failed: %s", e.what());
            }
            completed_.fetch_add(1, std::memory_order_relaxed);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (--pendingTasks_ == 0) {
                    idleCv_.notify_all();
                }
            }
        }
    }

private:
    std::vector<std::thread> workers_;
    std::deque<Task> tasks_;

    bool running_;
    size_t pendingTasks_;
    std::atomic<size_t> completed_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
};

} // namespace kott

#endif // THREAD_POOL_HPP
