#include <yardstick/runner/thread_pool.h>

namespace yardstick::runner {

ThreadPool::ThreadPool(size_t num_threads)
    : size_(num_threads == 0 ? 1 : num_threads), state_(std::make_shared<ThreadPoolState>()) {
    workers_.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        workers_.emplace_back([state = state_]() { worker_thread(state); });
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::unique_lock<std::mutex> lock(state_->queue_mutex);
        if (state_->stopping) {
            return;
        }
        state_->stopping = true;
    }

    state_->condition.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t ThreadPool::queue_size() const {
    std::unique_lock<std::mutex> lock(state_->queue_mutex);
    return state_->tasks.size();
}

void ThreadPool::worker_thread(std::shared_ptr<ThreadPoolState> state) {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(state->queue_mutex);
            state->condition.wait(lock,
                                  [&state] { return state->stopping || !state->tasks.empty(); });

            // Queued tasks are drained before exiting
            if (state->stopping && state->tasks.empty()) {
                return;
            }

            task = std::move(state->tasks.front());
            state->tasks.pop();
        }

        // packaged_task stores any exception in its future
        task();
    }
}

} // namespace yardstick::runner
