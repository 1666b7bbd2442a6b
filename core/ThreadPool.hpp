#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace crisisguard {

// Thrown by Enqueue() when the pool is stopped or its pending queue is full.
class PoolRejectedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ThreadPool {
public:
    // max_pending == 0 means the queue is unbounded.
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency(),
                        size_t max_pending = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto Enqueue(F&& f, Args&&... args) -> std::future<typename std::invoke_result<F, Args...>::type>;

    void Shutdown();
    size_t GetActiveThreadCount() const { return workers_.size(); }
    size_t GetQueueSize() const;
    size_t GetMaxPending() const { return max_pending_; }

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    const size_t max_pending_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
};

template<typename F, typename... Args>
auto ThreadPool::Enqueue(F&& f, Args&&... args) -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> res = task->get_future();
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw PoolRejectedError("Cannot enqueue on stopped ThreadPool");
        }
        if (max_pending_ > 0 && tasks_.size() >= max_pending_) {
            throw PoolRejectedError("ThreadPool queue is full");
        }
        tasks_.emplace([task]() { (*task)(); });
    }
    condition_.notify_one();
    return res;
}

} // namespace crisisguard
