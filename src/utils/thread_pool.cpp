#include "thread_pool.hpp"

#include <stdexcept>
#include <utility>

namespace concurrency {

    ThreadPool::ThreadPool(size_t num_threads) {
        if (num_threads == 0) {
            throw std::invalid_argument("ThreadPool needs at least one thread");
        }
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { work(); });
        }
    }

    ThreadPool::~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        task_ready_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    void ThreadPool::work() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                task_ready_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
                if (tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
                ++running_;
            }

            std::exception_ptr error;
            try {
                task();
            } catch (...) {
                error = std::current_exception();
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --running_;
                if (error && !first_error_) {
                    first_error_ = std::move(error);
                }
            }
            idle_.notify_all();
        }
    }

    void ThreadPool::enqueue(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("ThreadPool is shutting down");
            }
            tasks_.push(std::move(task));
        }
        task_ready_.notify_one();
    }

    void ThreadPool::wait_all() {
        std::exception_ptr error;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            idle_.wait(lock, [this] { return tasks_.empty() && running_ == 0; });
            error = std::exchange(first_error_, nullptr);
        }
        if (error) {
            std::rethrow_exception(error);
        }
    }
}  // namespace concurrency
