#pragma once

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

namespace s3io {

// Long-lived worker threads that run all network I/O for a transport.
// - Fixed number of worker threads, started in the constructor
// - Unbounded FIFO task queue
// - shutdown() drains queued tasks, then joins the workers
class IoExecutor {
public:
    explicit IoExecutor(size_t num_threads = 1);
    ~IoExecutor();

    IoExecutor(const IoExecutor&) = delete;
    IoExecutor& operator=(const IoExecutor&) = delete;
    IoExecutor(IoExecutor&&) = delete;
    IoExecutor& operator=(IoExecutor&&) = delete;

    // Submit a task and get a future for the result
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using ReturnType = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("Cannot submit to stopped I/O executor");
            }
            tasks_.emplace([task]() { (*task)(); });
        }

        queue_not_empty_.notify_one();
        return result;
    }

    // True when called from one of this executor's worker threads
    bool on_worker_thread() const;

    // Number of tasks waiting for a worker
    size_t pending() const;

    size_t thread_count() const { return workers_.size(); }

    // Finish queued tasks and join the workers. Idempotent.
    void shutdown();

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable queue_not_empty_;
    bool stopping_ = false;
};

}  // namespace s3io
