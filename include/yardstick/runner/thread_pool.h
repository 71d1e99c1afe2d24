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

namespace yardstick::runner {

/**
 * Fixed-size pool of worker threads. Tasks run in submission order; results
 * and exceptions travel back through the returned futures.
 *
 * Thread-safe and follows RAII principles.
 */
class ThreadPool {
public:
    /**
     * Create a thread pool with the specified number of threads.
     * @param num_threads Number of worker threads (0 is treated as 1)
     */
    explicit ThreadPool(size_t num_threads = 1);

    /**
     * Destructor - drains queued tasks and joins the workers.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * Submit a task to the thread pool and get a future for the result.
     * @throws std::runtime_error if the pool is stopping
     */
    template <typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> std::future<typename std::invoke_result_t<F, Args...>>;

    /**
     * Stop accepting work, run what is already queued, join the workers.
     */
    void stop();

    size_t queue_size() const;
    size_t size() const noexcept { return size_; }

    bool is_stopping() const { return state_->stopping.load(); }

private:
    struct ThreadPoolState {
        std::queue<std::function<void()>> tasks;
        mutable std::mutex queue_mutex;
        std::condition_variable condition;
        std::atomic<bool> stopping{false};
    };

    static void worker_thread(std::shared_ptr<ThreadPoolState> state);

    size_t size_;
    std::shared_ptr<ThreadPoolState> state_;
    std::vector<std::jthread> workers_;
};

// Template implementations

template <typename F, typename... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result_t<F, Args...>> {
    using return_type = typename std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        [f = std::forward<F>(f), ... args = std::forward<Args>(args)]() mutable {
            return std::invoke(std::move(f), std::move(args)...);
        });

    std::future<return_type> res = task->get_future();

    {
        std::unique_lock<std::mutex> lock(state_->queue_mutex);

        if (state_->stopping) {
            throw std::runtime_error("Cannot enqueue task: thread pool is stopping");
        }

        state_->tasks.emplace([task]() { (*task)(); });
    }

    state_->condition.notify_one();
    return res;
}

} // namespace yardstick::runner
