#include "s3io/io_executor.hpp"

namespace s3io {

namespace {

// Executor owning the current thread, if any
thread_local const IoExecutor* t_current_executor = nullptr;

}  // namespace

IoExecutor::IoExecutor(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] {
            worker_loop();
        });
    }
}

IoExecutor::~IoExecutor() {
    shutdown();
}

bool IoExecutor::on_worker_thread() const {
    return t_current_executor == this;
}

size_t IoExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void IoExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    queue_not_empty_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void IoExecutor::worker_loop() {
    t_current_executor = this;

    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_not_empty_.wait(lock, [this] {
                return stopping_ || !tasks_.empty();
            });

            // Drain the queue before exiting
            if (stopping_ && tasks_.empty()) {
                break;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task stores any exception in its future
        task();
    }

    t_current_executor = nullptr;
}

}  // namespace s3io
